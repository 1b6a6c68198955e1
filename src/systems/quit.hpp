#pragma once
#include "../core/corridor.hpp"

// Escape ends the session: QuitOnEscape emits AppExit, ExitWatch (Stage::Last)
// latches it into the ExitRequested resource before events are cleared so the
// host runner can see it between ticks.
class QuitSystem {
public:
    static void QuitOnEscape(corridor::Context& ctx);
    static void ExitWatch(corridor::Context& ctx);
};

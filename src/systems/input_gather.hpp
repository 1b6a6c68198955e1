#pragma once
#include "../core/corridor.hpp"

// ---------------------------------------------------------------------------
// InputGatherSystem: copies Raylib's keyboard state into the InputRecord and
// reports mouse motion and window size changes as events.
//
// Called by the backend runner between ticks, not scheduled as a system, so
// the events it emits (MouseMoved, WindowResized) are readable by every
// stage of the tick that follows.
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(corridor::App& app);
};

#pragma once
#include "../core/corridor.hpp"

// Window bookkeeping that needs no Raylib. TrackSize folds WindowResized
// into the WindowSize resource; FullscreenKey flips fullscreen on F and
// emits FullscreenToggled for the backend to apply.
class WindowSystem {
public:
    static void TrackSize(corridor::Context& ctx);
    static void FullscreenKey(corridor::Context& ctx);
};

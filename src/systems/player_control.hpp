#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../core/corridor.hpp"
#include "../input_state.hpp"

// First-person look and walk, driven by InputRecord and MouseMoved.
// Look must run before Move so movement uses this tick's heading. Both are
// idle while auto-walking; Look also works while hovering. Move only fills
// MoveIntent, WallCollisionSystem applies it.
class PlayerControlSystem {
public:
    static void Look(corridor::Context& ctx);
    static void Move(corridor::Context& ctx);

    // Pure updates with no world access. Exposed for unit testing.
    static void apply_look(const InputRecord& input, float mouse_dx, float mouse_dy,
                           const Tweaks& tweaks, float dt, Heading& heading);
    static Position move_delta(const InputRecord& input, const Heading& heading,
                               float speed, float dt);
};

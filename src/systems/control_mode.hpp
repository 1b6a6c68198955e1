#pragma once
#include "../components.hpp"
#include "../core/corridor.hpp"
#include "../input_state.hpp"
#include <optional>

// ---------------------------------------------------------------------------
// ControlModeSystem: Manual, Hover and AutoWalk.
//
// Space toggles AutoWalk and X toggles Hover; pressing the key of the active
// mode goes back to Manual. ReadInput stores the mode and emits
// ControlModeChanged. UpdateHover adds or removes NoClip on the player.
// AutoWalk follows the right-hand wall from cell centre to cell centre,
// crossing into the next chunk through the exit.
// ---------------------------------------------------------------------------

// One auto-walk step.
struct WalkStep {
    GridDirection direction;
    Position      target;
};

class ControlModeSystem {
public:
    static void ReadInput(corridor::Context& ctx);
    static void UpdateHover(corridor::Context& ctx);
    static void AutoWalk(corridor::Context& ctx);

    // Mode after this tick's input, or nullopt if unchanged.
    static std::optional<ControlMode> requested_mode(ControlMode current, const InputRecord& input);

    // Next step from cell: turn right if possible, else straight, left, back.
    // On the first step `previous` is tried as is. next is the chunk beyond
    // the exit, if spawned.
    static std::optional<WalkStep> choose_step(const Chunk& chunk, const Chunk* next,
                                               std::size_t cell, GridDirection previous,
                                               bool first_step);

    // Moves the running tween forward by dt at speed cells per second.
    static void advance(AutoWalkState& state, float dt, float speed, Position& p, Heading& h);
};

#pragma once
#include "../components.hpp"
#include "../core/corridor.hpp"
#include <random>

// ---------------------------------------------------------------------------
// MazeSetupSystem: builds and tears down a run.
//
// Enter is an OnEnter(Play) listener: it generates the first chunk, spawns
// its walls and floor plus the player (all tagged Reset), resets the control
// mode and the per-run stats. Exit is the OnExit(Play) listener that queues
// every Reset entity for destruction. Re-entering Play runs Exit then Enter.
//
// Restart consumes TweaksReloaded (and R) and schedules that re-entry.
// ---------------------------------------------------------------------------

class MazeSetupSystem {
public:
    static void Enter(corridor::Context& ctx);
    static void Exit(corridor::Context& ctx);
    static void Restart(corridor::Context& ctx);

    // Queues the chunk entity, its walls and floor tiles.
    static void spawn_chunk(ecs::CommandBuffer& cmd, Chunk chunk);

    // Yaw at the entrance looking down a random open passage.
    static float entrance_yaw(const Chunk& chunk, std::mt19937& rng);
};

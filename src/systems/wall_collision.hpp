#pragma once
#include "../components.hpp"
#include "../core/corridor.hpp"
#include <vector>

// Applies the player's MoveIntent while keeping the collision circle out of
// closed cell sides. Runs after PlayerControlSystem::Move. A player with
// NoClip moves freely.
class WallCollisionSystem {
public:
    static void Update(corridor::Context& ctx);

    // Longest sub-step; a step never skips past a neighbouring cell.
    static constexpr float MAX_STEP = 0.25f * CELL_SIZE;

    // Pushes p out of every closed side of one cell. Returns true if p was
    // moved.
    static bool resolve(const Chunk& chunk, std::size_t cell, float radius, Position& p);

    // Moves p by (dx, dz) in sub-steps. Each sub-step is clamped against the
    // cell it started in and then the cell it ended in, so a closed side is
    // never crossed however large the step. Moving out of every chunk is
    // refused. Returns true if any clamp applied.
    static bool step(const std::vector<const Chunk*>& chunks, float radius, Position& p,
                     float dx, float dz);
};

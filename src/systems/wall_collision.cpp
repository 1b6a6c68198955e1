#include "wall_collision.hpp"
#include "../chunk.hpp"
#include "tweaks.hpp"
#include <algorithm>
#include <cmath>

using namespace corridor;

static const Chunk* chunk_under(const std::vector<const Chunk*>& chunks, const Position& p) {
    auto it = std::find_if(chunks.begin(), chunks.end(),
                           [&](const Chunk* c) { return chunk_contains(*c, p); });
    return it == chunks.end() ? nullptr : *it;
}

bool WallCollisionSystem::resolve(const Chunk& chunk, std::size_t cell, float radius, Position& p) {
    const Position corner = chunk_cell_corner(chunk, cell);
    const float left   = corner.x;
    const float top    = corner.z;
    const float right  = left + CELL_SIZE;
    const float bottom = top + CELL_SIZE;

    const Position before = p;
    if (!side_open(chunk, cell, GridDirection::Left)  && p.x - radius < left)   p.x = left + radius;
    if (!side_open(chunk, cell, GridDirection::Right) && p.x + radius > right)  p.x = right - radius;
    if (!side_open(chunk, cell, GridDirection::Up)    && p.z - radius < top)    p.z = top + radius;
    if (!side_open(chunk, cell, GridDirection::Down)  && p.z + radius > bottom) p.z = bottom - radius;

    return p.x != before.x || p.z != before.z;
}

bool WallCollisionSystem::step(const std::vector<const Chunk*>& chunks, float radius, Position& p,
                               float dx, float dz) {
    const float length = std::sqrt(dx * dx + dz * dz);
    if (length <= 0.0f) return false;

    // Off the maze entirely (e.g. after hovering away): nothing to hit.
    if (!chunk_under(chunks, p)) {
        p.x += dx;
        p.z += dz;
        return false;
    }

    const int steps = static_cast<int>(std::ceil(length / MAX_STEP));
    const float sx = dx / static_cast<float>(steps);
    const float sz = dz / static_cast<float>(steps);

    bool clamped = false;
    for (int i = 0; i < steps; ++i) {
        const Chunk* from = chunk_under(chunks, p);
        if (!from) break;
        const std::size_t from_cell = chunk_cell_at(*from, p);

        Position next{p.x + sx, p.z + sz};
        clamped |= resolve(*from, from_cell, radius, next);

        const Chunk* to = chunk_under(chunks, next);
        if (!to) return true;
        clamped |= resolve(*to, chunk_cell_at(*to, next), radius, next);
        p = next;
    }
    return clamped;
}

void WallCollisionSystem::Update(Context& ctx) {
    auto* tweaks = ctx.try_resource<TweaksResource>();
    if (!tweaks) return;
    const float radius = tweaks->values.player_radius;

    auto& world = ctx.world();
    std::vector<const Chunk*> chunks;
    world.each<Chunk>([&](ecs::Entity, Chunk& c) { chunks.push_back(&c); });

    world.each<PlayerTag, Position, MoveIntent>(
        [&](ecs::Entity e, PlayerTag&, Position& p, MoveIntent& intent) {
            if (world.has<NoClip>(e)) {
                p.x += intent.dx;
                p.z += intent.dz;
            } else {
                step(chunks, radius, p, intent.dx, intent.dz);
            }
            intent = {};
        });
}

#include "chunk_streaming.hpp"
#include "../chunk.hpp"
#include "maze_setup.hpp"
#include <algorithm>

using namespace corridor;

void ChunkSystem::Track(Context& ctx) {
    auto& world = ctx.world();

    Position player{};
    bool found_player = false;
    world.each<PlayerTag, Position>([&](ecs::Entity, PlayerTag&, Position& p) {
        player = p;
        found_player = true;
    });
    if (!found_player) return;

    ecs::Entity here{};
    std::size_t here_index = 0;
    bool inside = false;
    world.each<Chunk>([&](ecs::Entity e, Chunk& c) {
        if (inside || !chunk_contains(c, player)) return;
        here = e;
        here_index = c.index;
        inside = true;
    });
    if (!inside) return;

    auto& current = ctx.init_resource<CurrentChunk>();
    if (current.entity && *current.entity == here) return;

    if (current.entity) ctx.emit(ChunkExited{*current.entity, current.index});
    current.entity = here;
    current.index  = here_index;
    ctx.emit(ChunkEntered{here, here_index});
}

void ChunkSystem::SpawnNext(Context& ctx) {
    const auto& entered = ctx.read<ChunkEntered>();
    if (entered.empty()) return;

    const Chunk* last = nullptr;
    ctx.world().each<Chunk>([&](ecs::Entity, Chunk& c) {
        if (!last || c.index > last->index) last = &c;
    });
    if (!last) return;

    const bool reached_last = std::any_of(entered.begin(), entered.end(),
                                          [&](const ChunkEntered& ev) { return ev.index == last->index; });
    if (!reached_last) return;

    Chunk next = next_chunk(*last, ctx.resource<MazeRng>().engine);
    MazeSetupSystem::spawn_chunk(ctx.commands(), std::move(next));
}

void ChunkSystem::DespawnTraversed(Context& ctx) {
    std::size_t deepest = 0;
    for (const auto& ev : ctx.read<ChunkEntered>()) deepest = std::max(deepest, ev.index);
    if (deepest < 2) return;

    // Keep the chunk just behind so the way back is never empty.
    const std::size_t keep_from = deepest - 1;
    auto& world = ctx.world();
    auto& cmd   = ctx.commands();
    world.each<Chunk>([&](ecs::Entity e, Chunk& c) {
        if (c.index < keep_from) cmd.destroy(e);
    });
    world.each<WallSegment>([&](ecs::Entity e, WallSegment& w) {
        if (w.chunk < keep_from) cmd.destroy(e);
    });
    world.each<FloorTile>([&](ecs::Entity e, FloorTile& f) {
        if (f.chunk < keep_from) cmd.destroy(e);
    });
}

void ChunkSystem::tally(PlayStats& stats, const std::vector<ChunkEntered>& entered) {
    for (const auto& ev : entered) {
        ++stats.chunks_entered;
        ++stats.chunks_total;
        stats.deepest_chunk = std::max(stats.deepest_chunk, ev.index);
    }
}

void ChunkSystem::Stats(Context& ctx) {
    tally(ctx.init_resource<PlayStats>(), ctx.read<ChunkEntered>());
}

#include "maze_setup.hpp"
#include "../chunk.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include <algorithm>
#include <vector>

using namespace corridor;

float MazeSetupSystem::entrance_yaw(const Chunk& chunk, std::mt19937& rng) {
    std::vector<GridDirection> open;
    for (auto d : ALL_DIRECTIONS)
        if (chunk.maze.has_link(chunk.entrance.cell, d)) open.push_back(d);
    if (open.empty()) return direction_yaw(opposite(chunk.entrance.side));

    std::uniform_int_distribution<std::size_t> pick(0, open.size() - 1);
    return direction_yaw(open[pick(rng)]);
}

void MazeSetupSystem::spawn_chunk(ecs::CommandBuffer& cmd, Chunk chunk) {
    const GridMaze& maze = chunk.maze;
    const float max_steps = static_cast<float>(std::max(1, chunk.distances.max_distance()));

    for (std::size_t cell = 0; cell < maze.size(); ++cell) {
        const Position corner = chunk_cell_corner(chunk, cell);
        const float shade = static_cast<float>(chunk.distances.get(cell).value_or(0)) / max_steps;
        cmd.create_with(FloorTile{chunk.index, corner.x, corner.z, shade}, Reset{});

        auto wall = [&](GridDirection side) {
            if (!side_open(chunk, cell, side))
                cmd.create_with(WallSegment{chunk.index, corner.x, corner.z, side}, Reset{});
        };
        wall(GridDirection::Up);
        wall(GridDirection::Left);
        if (maze.row_of(cell) + 1 == maze.rows()) wall(GridDirection::Down);
        if (maze.col_of(cell) + 1 == maze.cols()) wall(GridDirection::Right);
    }

    cmd.create_with(std::move(chunk), Reset{});
}

void MazeSetupSystem::Enter(Context& ctx) {
    const auto& cfg = ctx.init_resource<AppConfig>();
    auto&       rng = ctx.resource<MazeRng>().engine;

    Chunk first = generate_chunk(0, ChunkCoords{}, std::nullopt,
                                 static_cast<std::size_t>(cfg.maze_rows),
                                 static_cast<std::size_t>(cfg.maze_cols), rng);

    auto& cmd = ctx.commands();
    cmd.create_with(PlayerTag{}, chunk_cell_center(first, first.entrance.cell),
                    Heading{entrance_yaw(first, rng), 0.0f}, MoveIntent{}, Reset{});
    spawn_chunk(cmd, std::move(first));

    ctx.insert_resource(CurrentChunk{});
    ctx.insert_resource(ControlModeResource{});
    ctx.insert_resource(AutoWalkState{});

    auto& stats = ctx.init_resource<PlayStats>();
    ++stats.runs;
    stats.chunks_entered = 0;
    stats.deepest_chunk  = 0;
}

void MazeSetupSystem::Exit(Context& ctx) {
    std::vector<ecs::Entity> doomed;
    ctx.world().each<Reset>([&](ecs::Entity e, Reset&) { doomed.push_back(e); });
    for (auto e : doomed) ctx.commands().destroy(e);
}

void MazeSetupSystem::Restart(Context& ctx) {
    auto* input = ctx.try_resource<InputRecord>();
    const bool key = input && input->was_pressed(Keys::R);
    if (key || !ctx.read<TweaksReloaded>().empty())
        ctx.schedule_transition(GameState::Play);
}

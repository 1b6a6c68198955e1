#include "chunk.hpp"
#include "math_util.hpp"
#include <algorithm>
#include <cmath>

using namespace corridor;

Position chunk_origin(const Chunk& chunk) {
    return {static_cast<float>(chunk.coords.x) * static_cast<float>(chunk.maze.cols()) * CELL_SIZE,
            static_cast<float>(chunk.coords.z) * static_cast<float>(chunk.maze.rows()) * CELL_SIZE};
}

bool chunk_contains(const Chunk& chunk, const Position& p) {
    const Position o = chunk_origin(chunk);
    const float w = static_cast<float>(chunk.maze.cols()) * CELL_SIZE;
    const float h = static_cast<float>(chunk.maze.rows()) * CELL_SIZE;
    return p.x >= o.x && p.x < o.x + w && p.z >= o.z && p.z < o.z + h;
}

std::size_t chunk_cell_at(const Chunk& chunk, const Position& p) {
    const Position o = chunk_origin(chunk);
    auto clamp_axis = [](float v, std::size_t n) {
        const float f = std::floor(v / CELL_SIZE);
        if (f < 0.0f) return std::size_t{0};
        return std::min(static_cast<std::size_t>(f), n - 1);
    };
    return chunk.maze.index(clamp_axis(p.z - o.z, chunk.maze.rows()),
                            clamp_axis(p.x - o.x, chunk.maze.cols()));
}

Position chunk_cell_corner(const Chunk& chunk, std::size_t cell) {
    const Position o = chunk_origin(chunk);
    return {o.x + static_cast<float>(chunk.maze.col_of(cell)) * CELL_SIZE,
            o.z + static_cast<float>(chunk.maze.row_of(cell)) * CELL_SIZE};
}

Position chunk_cell_center(const Chunk& chunk, std::size_t cell) {
    const Position c = chunk_cell_corner(chunk, cell);
    return {c.x + 0.5f * CELL_SIZE, c.z + 0.5f * CELL_SIZE};
}

bool is_opening(const Chunk& chunk, std::size_t cell, GridDirection side) {
    if (cell == chunk.exit.cell && side == chunk.exit.side) return true;
    return chunk.entrance_open && cell == chunk.entrance.cell && side == chunk.entrance.side;
}

bool side_open(const Chunk& chunk, std::size_t cell, GridDirection side) {
    return chunk.maze.has_link(cell, side) || is_opening(chunk, cell, side);
}

float direction_yaw(GridDirection d) {
    switch (d) {
    case GridDirection::Right: return 0.0f;
    case GridDirection::Down:  return 0.5f * math::PI;
    case GridDirection::Left:  return math::PI;
    case GridDirection::Up:    return -0.5f * math::PI;
    }
    return 0.0f;
}

GridDirection direction_from_yaw(float yaw) {
    GridDirection best = GridDirection::Right;
    float best_diff = 4.0f * math::PI;
    for (auto d : ALL_DIRECTIONS) {
        const float diff = std::fabs(math::normalize_angle(yaw - direction_yaw(d)));
        if (diff < best_diff) {
            best_diff = diff;
            best = d;
        }
    }
    return best;
}

Chunk generate_chunk(std::size_t index, ChunkCoords coords, std::optional<SidedCell> entrance,
                     std::size_t rows, std::size_t cols, std::mt19937& rng) {
    Chunk chunk;
    chunk.index  = index;
    chunk.coords = coords;
    chunk.maze   = generate_maze(rows, cols, rng);
    if (chunk.maze.size() == 0) return chunk;

    if (entrance) {
        chunk.entrance      = *entrance;
        chunk.entrance_open = true;
    } else {
        std::uniform_int_distribution<int> pick_side(0, 3);
        const GridDirection side = ALL_DIRECTIONS[pick_side(rng)];
        const auto cells = chunk.maze.edge_cells(side);
        std::uniform_int_distribution<std::size_t> pick_cell(0, cells.size() - 1);
        chunk.entrance = {cells[pick_cell(rng)], side};
    }

    chunk.distances = Distances::from(chunk.maze, chunk.entrance.cell);

    // Farthest edge cell on any other side; later candidates win ties.
    int best = -1;
    for (auto side : ALL_DIRECTIONS) {
        if (side == chunk.entrance.side) continue;
        for (auto cell : chunk.maze.edge_cells(side)) {
            const int d = chunk.distances.get(cell).value_or(-1);
            if (d >= best) {
                best = d;
                chunk.exit = {cell, side};
            }
        }
    }
    return chunk;
}

Chunk next_chunk(const Chunk& last, std::mt19937& rng) {
    const GridMaze& maze = last.maze;
    const GridDirection out = last.exit.side;
    const std::size_t row = maze.row_of(last.exit.cell);
    const std::size_t col = maze.col_of(last.exit.cell);

    std::size_t entrance_cell = last.exit.cell;
    switch (out) {
    case GridDirection::Right: entrance_cell = maze.index(row, 0); break;
    case GridDirection::Left:  entrance_cell = maze.index(row, maze.cols() - 1); break;
    case GridDirection::Down:  entrance_cell = maze.index(0, col); break;
    case GridDirection::Up:    entrance_cell = maze.index(maze.rows() - 1, col); break;
    }

    const ChunkCoords coords{last.coords.x + column_step(out), last.coords.z + row_step(out)};
    return generate_chunk(last.index + 1, coords, SidedCell{entrance_cell, opposite(out)},
                          maze.rows(), maze.cols(), rng);
}

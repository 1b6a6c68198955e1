#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GridMaze: rows x cols grid of cells stored in row-major order.
//
// Cells are identified by their index (row * cols + col). A link is an open
// passage between two orthogonal neighbours; cells without a link in a
// direction have a wall there. No Raylib dependency.
// ---------------------------------------------------------------------------

enum class GridDirection { Up, Right, Down, Left };

constexpr GridDirection ALL_DIRECTIONS[] = {GridDirection::Up, GridDirection::Right,
                                            GridDirection::Down, GridDirection::Left};

inline GridDirection opposite(GridDirection d) {
    switch (d) {
    case GridDirection::Up:    return GridDirection::Down;
    case GridDirection::Right: return GridDirection::Left;
    case GridDirection::Down:  return GridDirection::Up;
    case GridDirection::Left:  return GridDirection::Right;
    }
    return d;
}

// Clockwise seen from above: Up -> Right -> Down -> Left.
inline GridDirection rotate_cw(GridDirection d) {
    return static_cast<GridDirection>((static_cast<int>(d) + 1) % 4);
}

inline GridDirection rotate_ccw(GridDirection d) {
    return static_cast<GridDirection>((static_cast<int>(d) + 3) % 4);
}

// Column / row step of a direction.
inline int column_step(GridDirection d) {
    return d == GridDirection::Right ? 1 : d == GridDirection::Left ? -1 : 0;
}

inline int row_step(GridDirection d) {
    return d == GridDirection::Down ? 1 : d == GridDirection::Up ? -1 : 0;
}

class GridMaze {
public:
    GridMaze() = default;
    GridMaze(std::size_t rows, std::size_t cols);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t size() const { return rows_ * cols_; }

    std::size_t index(std::size_t row, std::size_t col) const { return row * cols_ + col; }
    std::size_t row_of(std::size_t cell) const { return cell / cols_; }
    std::size_t col_of(std::size_t cell) const { return cell % cols_; }

    // Adjacent cell in a direction, or nullopt at the grid edge.
    std::optional<std::size_t> neighbor(std::size_t cell, GridDirection dir) const;

    // Adjacent cells in Up, Right, Down, Left order, linked or not.
    std::vector<std::size_t> neighbors(std::size_t cell) const;

    void link(std::size_t a, std::size_t b, bool bidirectional = true);
    bool linked(std::size_t a, std::size_t b) const;
    bool has_link(std::size_t cell, GridDirection dir) const;

    const std::vector<std::size_t>& links(std::size_t cell) const { return links_[cell]; }

    // Cells along one outer side, in row-major order.
    std::vector<std::size_t> edge_cells(GridDirection side) const;

    // Number of open passages, each counted once.
    std::size_t passage_count() const;

    // "+---+" box drawing, one text row per cell row plus walls.
    std::string to_string() const;

private:
    std::size_t                           rows_ = 0;
    std::size_t                           cols_ = 0;
    std::vector<std::vector<std::size_t>> links_;
};

// Wilson's algorithm: loop-erased random walks from unvisited cells until
// every cell joins the maze. The result is a uniform spanning tree, so every
// cell is reachable and there are exactly size() - 1 passages.
GridMaze generate_maze(std::size_t rows, std::size_t cols, std::mt19937& rng);

// ---------------------------------------------------------------------------
// Distances: breadth-first step counts from a root cell through passages.
// ---------------------------------------------------------------------------

class Distances {
public:
    static Distances from(const GridMaze& maze, std::size_t root);

    std::size_t root() const { return root_; }

    // Steps from the root, or nullopt if unreachable.
    std::optional<int> get(std::size_t cell) const;

    // Reachable cell with the greatest distance; the root on ties or when
    // nothing else is reachable.
    std::size_t farthest() const;
    int         max_distance() const;

private:
    std::size_t      root_ = 0;
    std::vector<int> steps_; // -1 = unreachable
};

#include "maze_grid.hpp"
#include <algorithm>
#include <cstddef>
#include <queue>

GridMaze::GridMaze(std::size_t rows, std::size_t cols)
    : rows_(rows), cols_(cols), links_(rows * cols) {}

std::optional<std::size_t> GridMaze::neighbor(std::size_t cell, GridDirection dir) const {
    const std::size_t r = row_of(cell);
    const std::size_t c = col_of(cell);
    switch (dir) {
    case GridDirection::Up:    if (r > 0)         return index(r - 1, c); break;
    case GridDirection::Right: if (c + 1 < cols_) return index(r, c + 1); break;
    case GridDirection::Down:  if (r + 1 < rows_) return index(r + 1, c); break;
    case GridDirection::Left:  if (c > 0)         return index(r, c - 1); break;
    }
    return std::nullopt;
}

std::vector<std::size_t> GridMaze::neighbors(std::size_t cell) const {
    std::vector<std::size_t> out;
    out.reserve(4);
    for (auto dir : {GridDirection::Up, GridDirection::Right, GridDirection::Down, GridDirection::Left}) {
        if (auto n = neighbor(cell, dir)) out.push_back(*n);
    }
    return out;
}

void GridMaze::link(std::size_t a, std::size_t b, bool bidirectional) {
    if (!linked(a, b)) links_[a].push_back(b);
    if (bidirectional && !linked(b, a)) links_[b].push_back(a);
}

bool GridMaze::linked(std::size_t a, std::size_t b) const {
    const auto& l = links_[a];
    return std::find(l.begin(), l.end(), b) != l.end();
}

bool GridMaze::has_link(std::size_t cell, GridDirection dir) const {
    auto n = neighbor(cell, dir);
    return n && linked(cell, *n);
}

std::vector<std::size_t> GridMaze::edge_cells(GridDirection side) const {
    std::vector<std::size_t> out;
    if (size() == 0) return out;
    switch (side) {
    case GridDirection::Up:    for (std::size_t c = 0; c < cols_; ++c) out.push_back(index(0, c)); break;
    case GridDirection::Down:  for (std::size_t c = 0; c < cols_; ++c) out.push_back(index(rows_ - 1, c)); break;
    case GridDirection::Left:  for (std::size_t r = 0; r < rows_; ++r) out.push_back(index(r, 0)); break;
    case GridDirection::Right: for (std::size_t r = 0; r < rows_; ++r) out.push_back(index(r, cols_ - 1)); break;
    }
    return out;
}

std::size_t GridMaze::passage_count() const {
    std::size_t total = 0;
    for (std::size_t a = 0; a < links_.size(); ++a) {
        for (auto b : links_[a]) {
            // Count a<->b once; one-way links count on their own.
            if (a < b || !linked(b, a)) ++total;
        }
    }
    return total;
}

std::string GridMaze::to_string() const {
    std::string out = "+";
    for (std::size_t c = 0; c < cols_; ++c) out += "---+";
    out += '\n';

    for (std::size_t r = 0; r < rows_; ++r) {
        std::string body   = "|";
        std::string bottom = "+";
        for (std::size_t c = 0; c < cols_; ++c) {
            const std::size_t cell = index(r, c);
            body   += has_link(cell, GridDirection::Right) ? "    " : "   |";
            bottom += has_link(cell, GridDirection::Down)  ? "   +" : "---+";
        }
        out += body + '\n';
        out += bottom + '\n';
    }
    return out;
}

GridMaze generate_maze(std::size_t rows, std::size_t cols, std::mt19937& rng) {
    GridMaze maze(rows, cols);
    const std::size_t n = maze.size();
    if (n == 0) return maze;

    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    std::vector<char> in_maze(n, 0);
    in_maze[pick(rng)] = 1;
    std::size_t remaining = n - 1;

    std::vector<std::size_t>    path;
    std::vector<std::ptrdiff_t> where(n, -1); // position of a cell in path

    while (remaining > 0) {
        std::size_t cur;
        do { cur = pick(rng); } while (in_maze[cur]);

        path.clear();
        path.push_back(cur);
        where[cur] = 0;

        // Walk until the maze is hit, erasing loops as they form.
        while (!in_maze[cur]) {
            const auto options = maze.neighbors(cur);
            std::uniform_int_distribution<std::size_t> step(0, options.size() - 1);
            cur = options[step(rng)];

            if (where[cur] >= 0) {
                const auto keep = static_cast<std::size_t>(where[cur]) + 1;
                for (std::size_t i = keep; i < path.size(); ++i) where[path[i]] = -1;
                path.resize(keep);
            } else {
                where[cur] = static_cast<std::ptrdiff_t>(path.size());
                path.push_back(cur);
            }
        }

        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            maze.link(path[i], path[i + 1]);
            in_maze[path[i]] = 1;
            --remaining;
        }
        for (auto cell : path) where[cell] = -1;
    }
    return maze;
}

Distances Distances::from(const GridMaze& maze, std::size_t root) {
    Distances d;
    d.root_ = root;
    d.steps_.assign(maze.size(), -1);
    if (root >= maze.size()) return d;

    std::queue<std::size_t> frontier;
    d.steps_[root] = 0;
    frontier.push(root);
    while (!frontier.empty()) {
        const std::size_t cell = frontier.front();
        frontier.pop();
        for (auto next : maze.links(cell)) {
            if (d.steps_[next] >= 0) continue;
            d.steps_[next] = d.steps_[cell] + 1;
            frontier.push(next);
        }
    }
    return d;
}

std::optional<int> Distances::get(std::size_t cell) const {
    if (cell >= steps_.size() || steps_[cell] < 0) return std::nullopt;
    return steps_[cell];
}

std::size_t Distances::farthest() const {
    std::size_t best = root_;
    int best_steps = 0;
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i] > best_steps) {
            best = i;
            best_steps = steps_[i];
        }
    }
    return best;
}

int Distances::max_distance() const {
    int best = 0;
    for (auto s : steps_) best = std::max(best, s);
    return best;
}

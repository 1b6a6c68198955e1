#pragma once
#include "components.hpp"
#include <cstddef>
#include <optional>
#include <random>

// ---------------------------------------------------------------------------
// Chunk geometry and generation. Pure functions, no world access.
//
// A chunk with coords (cx, cz) covers the world rectangle starting at
// (cx * cols, cz * rows) cells. Cells are addressed by the chunk's row-major
// index; world positions are in units of CELL_SIZE.
// ---------------------------------------------------------------------------

// World-space minimum corner of the chunk.
Position chunk_origin(const Chunk& chunk);

// Half-open: the left / top edges belong to the chunk.
bool chunk_contains(const Chunk& chunk, const Position& p);

// Cell under a world position, clamped to the chunk.
std::size_t chunk_cell_at(const Chunk& chunk, const Position& p);

Position chunk_cell_center(const Chunk& chunk, std::size_t cell);

// Minimum corner of a cell in world units.
Position chunk_cell_corner(const Chunk& chunk, std::size_t cell);

// True for the exit's outer side and, once opened, the entrance's.
bool is_opening(const Chunk& chunk, std::size_t cell, GridDirection side);

// A side is walkable when it is a passage or an opening.
bool side_open(const Chunk& chunk, std::size_t cell, GridDirection side);

// Yaw looking in a grid direction (Right = 0, Down = PI/2).
float direction_yaw(GridDirection d);

// Grid direction closest to a yaw.
GridDirection direction_from_yaw(float yaw);

// Builds a chunk. Without a known entrance (the first chunk) a random outer
// side and edge cell are picked and left walled. The exit is the edge cell
// farthest from the entrance on any other side.
Chunk generate_chunk(std::size_t index, ChunkCoords coords,
                     std::optional<SidedCell> entrance,
                     std::size_t rows, std::size_t cols, std::mt19937& rng);

// The chunk beyond last's exit, entered through the matching cell.
Chunk next_chunk(const Chunk& last, std::mt19937& rng);

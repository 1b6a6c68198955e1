#pragma once
#include "maze_grid.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

// ---------------------------------------------------------------------------
// Application states
// ---------------------------------------------------------------------------

enum class GameState : std::uint32_t { Preload, Play };

inline const char* game_state_name(GameState s) {
    return s == GameState::Preload ? "Preload" : "Play";
}

// World units per maze cell.
constexpr float CELL_SIZE = 1.0f;

// Eye height above the floor while hovering.
constexpr float HOVER_ALTITUDE = 4.0f;

// ---------------------------------------------------------------------------
// Components
// ---------------------------------------------------------------------------

// Ground-plane position in world units (x right, z down the maze rows).
struct Position {
    float x = 0.0f;
    float z = 0.0f;
};

// yaw 0 looks along +x; positive yaw turns toward +z.
struct Heading {
    float yaw   = 0.0f;
    float pitch = 0.0f;
};

struct PlayerTag {};

// Displacement requested this tick. PlayerControlSystem::Move writes it,
// WallCollisionSystem applies it.
struct MoveIntent {
    float dx = 0.0f;
    float dz = 0.0f;
};

// Present while hovering: walls are ignored and the eye is lifted.
struct NoClip {
    float altitude = HOVER_ALTITUDE;
};

// ---------------------------------------------------------------------------
// Chunks
//
// The maze is endless: a chain of equally sized GridMazes laid out on a
// chunk grid. Each chunk is entered through one outer side of a cell and
// left through the exit cell's outer side, which lines up with the next
// chunk's entrance.
// ---------------------------------------------------------------------------

struct ChunkCoords {
    int x = 0;
    int z = 0;

    bool operator==(const ChunkCoords& o) const { return x == o.x && z == o.z; }
    bool operator!=(const ChunkCoords& o) const { return !(*this == o); }
};

struct SidedCell {
    std::size_t   cell = 0;
    GridDirection side = GridDirection::Up;
};

struct Chunk {
    std::size_t index = 0; // 0 for the first chunk of a run, +1 per chunk
    ChunkCoords coords;
    GridMaze    maze;
    Distances   distances;  // from the entrance cell
    SidedCell   entrance;
    SidedCell   exit;
    bool        entrance_open = false; // the first chunk's entrance stays walled
};

// One closed side of a cell. (x, z) is the cell's minimum corner in world
// units. Up/Left sides are spawned for every cell, Down and Right only along
// the last row / column.
struct WallSegment {
    std::size_t   chunk = 0;
    float         x     = 0.0f;
    float         z     = 0.0f;
    GridDirection side  = GridDirection::Up;
};

// shade in [0, 1]: distance from the chunk entrance relative to the farthest
// cell.
struct FloorTile {
    std::size_t chunk = 0;
    float       x     = 0.0f;
    float       z     = 0.0f;
    float       shade = 0.0f;
};

// Everything spawned for a run carries Reset; leaving Play destroys it.
struct Reset {};

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------

struct MazeRng {
    std::mt19937 engine;
};

// Chunk the player stood in at the end of the last ChunkSystem::Track.
struct CurrentChunk {
    std::optional<ecs::Entity> entity;
    std::size_t                index = 0;
};

enum class ControlMode : std::uint8_t { Manual, Hover, AutoWalk };

inline const char* control_mode_name(ControlMode m) {
    switch (m) {
    case ControlMode::Manual:   return "Manual";
    case ControlMode::Hover:    return "Hover";
    case ControlMode::AutoWalk: return "AutoWalk";
    }
    return "?";
}

struct ControlModeResource {
    ControlMode mode = ControlMode::Manual;
};

// One auto-walk step: a tween from the current spot to a neighbouring cell
// centre, turning toward it on the way.
struct AutoWalkState {
    Position                     from;
    Position                     to;
    float                        yaw_from = 0.0f;
    float                        yaw_to   = 0.0f;
    std::optional<float>         progress;  // in [0, 1) while a step runs
    std::optional<GridDirection> heading;   // direction of the last step
};

struct PlayStats {
    std::size_t runs           = 0; // times Play was entered
    std::size_t chunks_entered = 0; // this run
    std::size_t deepest_chunk  = 0; // this run
    std::size_t chunks_total   = 0; // all runs
};

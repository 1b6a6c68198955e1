#include "renderer.hpp"
#include "../chunk.hpp"
#include "../components.hpp"
#include "tweaks.hpp"
#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace corridor;

static constexpr float WALL_THICKNESS = 0.05f;
static constexpr float FOV_Y          = 70.0f;

// 0xRRGGBB scaled by a light factor in [0, 1].
static Color to_raylib(std::uint32_t rgb, float light = 1.0f) {
    light = std::clamp(light, 0.0f, 1.0f);
    auto channel = [&](int shift) {
        return static_cast<unsigned char>(static_cast<float>((rgb >> shift) & 0xFF) * light);
    };
    return Color{channel(16), channel(8), channel(0), 255};
}

static Vector3 wall_center(const WallSegment& w, float height) {
    const float y = height * 0.5f;
    switch (w.side) {
        case GridDirection::Up:    return {w.x + 0.5f * CELL_SIZE, y, w.z};
        case GridDirection::Down:  return {w.x + 0.5f * CELL_SIZE, y, w.z + CELL_SIZE};
        case GridDirection::Left:  return {w.x, y, w.z + 0.5f * CELL_SIZE};
        case GridDirection::Right: return {w.x + CELL_SIZE, y, w.z + 0.5f * CELL_SIZE};
    }
    return {w.x, y, w.z};
}

// Middle of a cell's outer side.
static Vector3 side_center(const Chunk& chunk, const SidedCell& s, float y) {
    const Position c = chunk_cell_center(chunk, s.cell);
    const float half = 0.5f * CELL_SIZE;
    return {c.x + static_cast<float>(column_step(s.side)) * half, y,
            c.z + static_cast<float>(row_step(s.side)) * half};
}

// Alternating chunks are told apart by a slight tint.
static float chunk_light(std::size_t index) {
    return index % 2 == 0 ? 1.0f : 0.85f;
}

void RenderSystem::OnArchetype(Context& ctx, const ArchetypeSignature& sig) {
    auto* cache = ctx.try_resource<WallRenderCache>();
    if (cache && cache->filter.absorb(sig))
        TraceLog(LOG_INFO, "corridor: wall renderer now matches %d archetype(s)",
                 static_cast<int>(cache->filter.matched().size()));
}

void RenderSystem::Begin(Context& ctx) {
    const auto* tweaks = ctx.try_resource<TweaksResource>();
    BeginDrawing();
    ClearBackground(to_raylib(tweaks ? tweaks->values.ceiling_color : 0x202028));
}

void RenderSystem::Draw(Context& ctx) {
    auto* tweaks_res = ctx.try_resource<TweaksResource>();
    if (!tweaks_res) return;
    const Tweaks& tweaks = tweaks_res->values;
    auto& world = ctx.world();

    // 1. Camera at the player's eyes, lifted while hovering
    Camera3D camera   = {};
    camera.up         = {0.0f, 1.0f, 0.0f};
    camera.fovy       = FOV_Y;
    camera.projection = CAMERA_PERSPECTIVE;

    bool has_player = false;
    world.each<PlayerTag, Position, Heading>([&](ecs::Entity e, PlayerTag&, Position& p, Heading& h) {
        const NoClip* hover = world.try_get<NoClip>(e);
        const float eye = tweaks.wall_height * 0.5f + (hover ? hover->altitude : 0.0f);
        const float cp  = std::cos(h.pitch);
        camera.position = {p.x, eye, p.z};
        camera.target   = {p.x + std::cos(h.yaw) * cp, eye + std::sin(h.pitch), p.z + std::sin(h.yaw) * cp};
        has_player = true;
    });
    if (!has_player) return;

    const float ambient = tweaks.ambient_light_intensity;

    // 2. Scene
    BeginMode3D(camera);
        // Floor darkens away from each chunk's entrance.
        world.each<FloorTile>([&](ecs::Entity, FloorTile& f) {
            const Vector3 center = {f.x + 0.5f * CELL_SIZE, 0.0f, f.z + 0.5f * CELL_SIZE};
            const float light = ambient + (1.0f - ambient) * (1.0f - 0.6f * f.shade);
            DrawPlane(center, {CELL_SIZE, CELL_SIZE}, to_raylib(tweaks.floor_color, light));
        });

        auto* cache = ctx.try_resource<WallRenderCache>();
        if (cache && !cache->filter.empty()) {
            world.each<WallSegment>([&](ecs::Entity, WallSegment& w) {
                const float lit = chunk_light(w.chunk);
                const bool horizontal = w.side == GridDirection::Up || w.side == GridDirection::Down;
                const float sx = horizontal ? CELL_SIZE : WALL_THICKNESS;
                const float sz = horizontal ? WALL_THICKNESS : CELL_SIZE;
                const Vector3 c = wall_center(w, tweaks.wall_height);
                DrawCube(c, sx, tweaks.wall_height, sz,
                         to_raylib(tweaks.wall_color, (ambient + (1.0f - ambient) * 0.8f) * lit));
                DrawCubeWires(c, sx, tweaks.wall_height, sz, to_raylib(tweaks.wall_color, ambient));
            });
        }

        // Exit openings
        world.each<Chunk>([&](ecs::Entity, Chunk& chunk) {
            DrawSphere(side_center(chunk, chunk.exit, 0.1f), 0.12f * CELL_SIZE,
                       to_raylib(tweaks.exit_color));
        });
    EndMode3D();

    // 3. HUD
    DrawText("WASD: Move | MOUSE/ARROWS: Look | SPACE: Auto-walk | X: Hover | F: Fullscreen | R: New maze | ESC: Quit",
             10, GetScreenHeight() - 30, 20, LIGHTGRAY);
    if (!tweaks_res->error.empty())
        DrawText(tweaks_res->error.c_str(), 10, GetScreenHeight() - 55, 16, ORANGE);
}

void RenderSystem::End(Context&) {
    EndDrawing();
}

#pragma once
#include "../core/corridor.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include "../systems/debug.hpp"
#include <raylib.h>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Inserts the DebugPanel with the windowed rows (FPS, frame time, window
// size, live entities) and schedules DebugSystem::Draw at Stage::Render.
//
// Ordering: after RenderModule so the overlay lands on top of the scene, and
// before MazeModule so the game finds the panel and appends its rows.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(corridor::AppBuilder& app) {
        ecs::World& world = app.world();
        DebugPanel panel;

        panel.watch("Engine", "FPS", [] { return std::to_string(GetFPS()); });
        panel.watch("Engine", "Frame", [] {
            return std::string(TextFormat("%.1f ms", GetFrameTime() * 1000.0f));
        });
        panel.watch("Engine", "Window", [&world] {
            auto* size = world.try_resource<WindowSize>();
            if (!size) return std::string("-");
            return std::string(TextFormat("%dx%d", size->width, size->height));
        });
        panel.watch("Engine", "Entities", [&world] { return std::to_string(world.count()); });

        app.insert_resource(std::move(panel));
        app.add_system_to_stage(corridor::Stage::Render, DebugSystem::Draw, "debug_overlay");
    }
};

#pragma once
#include "../config.hpp"
#include "../core/corridor.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../systems/input_gather.hpp"
#include "quit_module.hpp"
#include "window_module.hpp"
#include <algorithm>
#include <raylib.h>

// ---------------------------------------------------------------------------
// BackendModule
//
// Raylib host. Installs WindowModule and QuitModule, applies
// FullscreenToggled to the real window, and sets the runner that owns the
// window and the frame loop.
//
// Per frame: stop on window close or ExitRequested, gather input (emits
// MouseMoved / WindowResized), set FrameClock::delta, tick.
// ---------------------------------------------------------------------------

struct BackendModule {
    // A stalled frame (window drag, breakpoint) counts as this much time.
    static constexpr float MAX_FRAME_DELTA = 0.1f;

    static void install(corridor::AppBuilder& app) {
        app.add_module<WindowModule>();
        app.add_module<QuitModule>();
        app.add_system_to_stage(corridor::Stage::PostUpdate, apply_fullscreen, "apply_fullscreen");
        app.set_runner(run);
    }

    static void apply_fullscreen(corridor::Context& ctx) {
        for (const auto& ev : ctx.read<FullscreenToggled>()) {
            if (IsWindowFullscreen() != ev.fullscreen) ToggleFullscreen();
            TraceLog(LOG_INFO, "corridor: fullscreen %s", ev.fullscreen ? "on" : "off");
        }
    }

    static void run(corridor::App app) {
        AppConfig cfg;
        if (auto* c = app.try_resource<AppConfig>()) cfg = *c;

        SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
        InitWindow(cfg.window_width, cfg.window_height, cfg.title.c_str());
        SetExitKey(KEY_NULL); // Escape goes through AppExit
        SetTargetFPS(cfg.target_fps);
        DisableCursor();

        auto& size = app.resource<WindowSize>();
        size.width  = GetScreenWidth();
        size.height = GetScreenHeight();
        TraceLog(LOG_INFO, "corridor: %d systems, %d state listeners",
                 static_cast<int>(app.system_count()), static_cast<int>(app.listener_count()));

        while (!WindowShouldClose() && !app.resource<ExitRequested>().value) {
            InputGatherSystem::Update(app);
            app.resource<corridor::FrameClock>().delta = std::min(GetFrameTime(), MAX_FRAME_DELTA);
            app.tick();
        }

        TraceLog(LOG_INFO, "corridor: exiting after %llu ticks",
                 static_cast<unsigned long long>(app.frame()));
        EnableCursor();
        CloseWindow();
    }
};

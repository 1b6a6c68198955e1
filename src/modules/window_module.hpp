#pragma once
#include "../core/corridor.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../systems/window.hpp"

// ---------------------------------------------------------------------------
// WindowModule
//
// Window and input plumbing shared by the Raylib backend and headless tests:
// the InputRecord / WindowSize resources, the input events and the systems
// that consume WindowResized and the F key. Installing it twice does
// nothing, so both BackendModule and MazeModule can depend on it.
// ---------------------------------------------------------------------------

struct WindowModule {
    static void install(corridor::AppBuilder& app) {
        if (app.world().has_resource<WindowSize>()) return;
        app.add_event<WindowResized>()
           .add_event<MouseMoved>()
           .add_event<FullscreenToggled>();
        app.init_resource<InputRecord>();
        app.init_resource<WindowSize>();
        app.add_system_to_stage(corridor::Stage::First, WindowSystem::TrackSize, "track_window_size");
        app.add_system_to_stage(corridor::Stage::PreUpdate, WindowSystem::FullscreenKey, "fullscreen_key");
    }
};

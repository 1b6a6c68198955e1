#pragma once
#include "../core/corridor.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../systems/quit.hpp"

// ---------------------------------------------------------------------------
// QuitModule
//
// Registers AppExit, the Escape key binding and the ExitRequested latch the
// runner polls between ticks. Headless; tests can drive it through the
// InputRecord.
// ---------------------------------------------------------------------------

struct QuitModule {
    static void install(corridor::AppBuilder& app) {
        app.add_event<AppExit>();
        app.init_resource<ExitRequested>();
        app.init_resource<InputRecord>();
        app.add_system_to_stage(corridor::Stage::PreUpdate, QuitSystem::QuitOnEscape, "quit_on_escape");
        app.add_system_to_stage(corridor::Stage::Last, QuitSystem::ExitWatch, "exit_watch");
    }
};

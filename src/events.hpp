#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>

// ---------------------------------------------------------------------------
// Concrete event types
//
// Each is registered with AppBuilder::add_event<T>() by the module that owns
// its emitter and lives for exactly one tick.
// ---------------------------------------------------------------------------

// Emitted by QuitSystem::QuitOnEscape (or any system) to end the session.
struct AppExit {};

// Emitted by InputGatherSystem when the framebuffer size changes.
struct WindowResized {
    int width;
    int height;
};

// Emitted by InputGatherSystem when the mouse moved this frame.
struct MouseMoved {
    float dx;
    float dy;
};

// Emitted by WindowSystem::FullscreenKey; the backend applies it.
struct FullscreenToggled {
    bool fullscreen;
};

// Emitted by ChunkSystem::Track when the player crosses into another chunk.
struct ChunkEntered {
    ecs::Entity chunk;
    std::size_t index;
};

struct ChunkExited {
    ecs::Entity chunk;
    std::size_t index;
};

// Emitted by ControlModeSystem::ReadInput with the new mode.
struct ControlModeChanged {
    ControlMode mode;
};

// Emitted by TweaksSystem::Watch after a successful hot reload.
struct TweaksReloaded {};

#pragma once
#include <cstddef>

// ---------------------------------------------------------------------------
// InputRecord: one frame of keyboard state. Mouse motion arrives as
// MouseMoved events.
//
// Stored as a World resource. InputGatherSystem fills it from Raylib at the
// start of every tick; game systems only read it, so they stay free of any
// windowing dependency and can be driven directly from tests.
// ---------------------------------------------------------------------------

// Key codes share Raylib's (GLFW) numbering so the gather step can copy them
// straight through.
namespace Keys {
    constexpr int Space  = 32;
    constexpr int A      = 65;
    constexpr int D      = 68;
    constexpr int F      = 70;
    constexpr int R      = 82;
    constexpr int S      = 83;
    constexpr int W      = 87;
    constexpr int X      = 88;
    constexpr int Escape = 256;
    constexpr int Right  = 262;
    constexpr int Left   = 263;
    constexpr int Down   = 264;
    constexpr int Up     = 265;
    constexpr int F3     = 292;
    constexpr int LeftShift = 340;
}

struct InputRecord {
    static constexpr std::size_t KEY_COUNT = 512;

    bool keys_down[KEY_COUNT]    = {false};
    bool keys_pressed[KEY_COUNT] = {false};

    bool is_down(int key) const {
        return key >= 0 && static_cast<std::size_t>(key) < KEY_COUNT && keys_down[key];
    }

    bool was_pressed(int key) const {
        return key >= 0 && static_cast<std::size_t>(key) < KEY_COUNT && keys_pressed[key];
    }

    // Test and replay helpers.
    void press(int key) {
        if (key < 0 || static_cast<std::size_t>(key) >= KEY_COUNT) return;
        if (!keys_down[key]) keys_pressed[key] = true;
        keys_down[key] = true;
    }

    void release(int key) {
        if (key < 0 || static_cast<std::size_t>(key) >= KEY_COUNT) return;
        keys_down[key] = false;
    }

    void clear_pressed() {
        for (auto& k : keys_pressed) k = false;
    }
};

// Kept current from WindowResized / FullscreenToggled by WindowSystem.
struct WindowSize {
    int  width      = 0;
    int  height     = 0;
    bool fullscreen = false;
};

// Set by ExitWatchSystem when an AppExit event was seen this tick; the host
// runner stops calling App::tick() once it is true.
struct ExitRequested {
    bool value = false;
};

#include "input_gather.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include <raylib.h>

void InputGatherSystem::Update(corridor::App& app) {
    auto& input = app.resource<InputRecord>();

    // 1. Keyboard
    for (int i = 0; i < static_cast<int>(InputRecord::KEY_COUNT); i++) {
        input.keys_down[i]    = IsKeyDown(i);
        input.keys_pressed[i] = IsKeyPressed(i);
    }

    // 2. Mouse
    const Vector2 delta = GetMouseDelta();
    if (delta.x != 0.0f || delta.y != 0.0f) app.emit_event(MouseMoved{delta.x, delta.y});

    // 3. Window. WindowSystem::TrackSize applies the event during the tick.
    const auto& size = app.resource<WindowSize>();
    const int w = GetScreenWidth();
    const int h = GetScreenHeight();
    if (w != size.width || h != size.height) {
        app.emit_event(WindowResized{w, h});
        TraceLog(LOG_INFO, "corridor: window resized to %dx%d", w, h);
    }
}

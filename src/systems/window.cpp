#include "window.hpp"
#include "../events.hpp"
#include "../input_state.hpp"

using namespace corridor;

void WindowSystem::TrackSize(Context& ctx) {
    const auto& resized = ctx.read<WindowResized>();
    if (resized.empty()) return;
    auto& size  = ctx.init_resource<WindowSize>();
    size.width  = resized.back().width;
    size.height = resized.back().height;
}

void WindowSystem::FullscreenKey(Context& ctx) {
    auto* input = ctx.try_resource<InputRecord>();
    if (!input || !input->was_pressed(Keys::F)) return;

    auto& size = ctx.init_resource<WindowSize>();
    size.fullscreen = !size.fullscreen;
    ctx.emit(FullscreenToggled{size.fullscreen});
}

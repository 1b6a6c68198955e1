#include "quit.hpp"
#include "../events.hpp"
#include "../input_state.hpp"

using namespace corridor;

void QuitSystem::QuitOnEscape(Context& ctx) {
    auto* input = ctx.try_resource<InputRecord>();
    if (input && input->was_pressed(Keys::Escape)) ctx.emit(AppExit{});
}

void QuitSystem::ExitWatch(Context& ctx) {
    if (!ctx.read<AppExit>().empty()) ctx.init_resource<ExitRequested>().value = true;
}

#include "tweaks.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include <system_error>

namespace fs = std::filesystem;

void TweaksSystem::Load(corridor::Context& ctx) {
    auto& cfg = ctx.init_resource<AppConfig>();
    auto& res = ctx.init_resource<TweaksResource>();
    if (res.ready) return;

    res.path = cfg.tweaks_path;
    if (ConfigLoader::load(res.values, res.path)) {
        res.loaded_from_file = true;
        std::error_code ec;
        res.stamp = fs::last_write_time(res.path, ec);
        res.error.clear();
    } else {
        res.error = "could not load '" + res.path + "', using defaults";
    }
    res.ready = true;
}

void TweaksSystem::WaitUntilReady(corridor::Context& ctx) {
    auto* res = ctx.try_resource<TweaksResource>();
    if (res && res->ready) ctx.schedule_transition(GameState::Play);
}

void TweaksSystem::Watch(corridor::Context& ctx) {
    auto* res = ctx.try_resource<TweaksResource>();
    if (!res || !res->loaded_from_file) return;

    const auto& cfg = ctx.resource<AppConfig>();
    res->poll_timer += ctx.delta();
    if (res->poll_timer < cfg.tweaks_poll_interval) return;
    res->poll_timer = 0.0f;

    if (reload_if_changed(*res)) ctx.emit(TweaksReloaded{});
}

bool TweaksSystem::reload_if_changed(TweaksResource& res) {
    if (!res.loaded_from_file) return false;

    std::error_code ec;
    const auto now = fs::last_write_time(res.path, ec);
    if (ec || now == res.stamp) return false;
    res.stamp = now;

    Tweaks fresh = res.values;
    if (!ConfigLoader::load(fresh, res.path)) {
        res.error = "could not reload '" + res.path + "', keeping previous values";
        return false;
    }
    res.values = fresh;
    res.error.clear();
    return true;
}

#pragma once
#include "../config.hpp"
#include "../core/corridor.hpp"
#include <filesystem>
#include <string>

// ---------------------------------------------------------------------------
// TweaksResource: the live Tweaks plus where they came from.
//
// A host or test may insert it with ready = true to skip file loading.
// ---------------------------------------------------------------------------

struct TweaksResource {
    Tweaks                          values;
    bool                            ready            = false;
    bool                            loaded_from_file = false;
    std::string                     path;
    std::string                     error;       // last load failure, empty if none
    std::filesystem::file_time_type stamp{};
    float                           poll_timer = 0.0f;
};

// Loads tweaks at startup, holds Preload until they are ready, and reports
// changes on disk as TweaksReloaded (MazeSetupSystem::Restart restarts the
// run on it).
class TweaksSystem {
public:
    // Startup system.
    static void Load(corridor::Context& ctx);

    // Preload stage system: schedules Play once tweaks are ready.
    static void WaitUntilReady(corridor::Context& ctx);

    // Play stage system: polls the file every AppConfig::tweaks_poll_interval
    // seconds; a successful reload emits TweaksReloaded.
    static void Watch(corridor::Context& ctx);

    // Reloads res.values when the file's write time moved. Returns true if
    // new values were applied. Exposed for unit testing.
    static bool reload_if_changed(TweaksResource& res);
};

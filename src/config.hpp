#pragma once
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// AppConfig: process-level settings read once at startup.
// Stored as a World resource by main().
// ---------------------------------------------------------------------------

struct AppConfig {
    int         window_width         = 1280;
    int         window_height        = 720;
    std::string title                = "corridor";
    int         target_fps           = 60;
    int         maze_rows            = 12;
    int         maze_cols            = 12;
    std::uint32_t seed               = 0;   // 0 = seed from std::random_device
    std::string tweaks_path          = "resources/tweaks.json";
    float       tweaks_poll_interval = 1.0f; // seconds between mtime checks
};

// ---------------------------------------------------------------------------
// Tweaks: gameplay and look values that can be edited while the game runs.
// Colors are 0xRRGGBB.
// ---------------------------------------------------------------------------

struct Tweaks {
    float         ambient_light_intensity = 0.1f;
    std::uint32_t wall_color              = 0xFFFFFF;
    std::uint32_t floor_color             = 0xFFFFFF;
    std::uint32_t ceiling_color           = 0x202028;
    std::uint32_t exit_color              = 0xE0B040;
    float         mouse_sensitivity       = 0.0045f;
    float         mouse_delta_cap         = 60.0f;
    float         move_speed              = 2.0f;  // cells per second
    float         turn_speed              = 2.5f;  // radians per second
    float         player_radius           = 0.2f;
    float         wall_height             = 1.0f;
};

// ---------------------------------------------------------------------------
// ConfigLoader: reads JSON into AppConfig / Tweaks.
//
// Missing keys keep their defaults. Returns false if the file cannot be
// opened or the JSON is malformed; the output is left untouched in that case.
// No Raylib dependency.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    static bool load(AppConfig& out, const std::string& path);
    static bool load_from_string(AppConfig& out, const std::string& json);

    static bool load(Tweaks& out, const std::string& path);
    static bool load_from_string(Tweaks& out, const std::string& json);
};

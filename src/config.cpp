#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>{});
    return true;
}

// Accepts "#RRGGBB", "RRGGBB" or a plain integer.
static std::uint32_t parse_color(const json& j) {
    if (j.is_number_unsigned() || j.is_number_integer()) return j.get<std::uint32_t>() & 0xFFFFFFu;
    std::string s = j.get<std::string>();
    if (!s.empty() && s[0] == '#') s.erase(0, 1);
    if (s.size() != 6) throw std::runtime_error("ConfigLoader: bad color '" + s + "'");
    return static_cast<std::uint32_t>(std::stoul(s, nullptr, 16));
}

static void read_color(const json& j, const char* key, std::uint32_t& out) {
    if (j.contains(key)) out = parse_color(j[key]);
}

// ---------------------------------------------------------------------------
// AppConfig
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(AppConfig& out, const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        AppConfig cfg = out;

        if (j.contains("window")) {
            const auto& w = j["window"];
            cfg.window_width  = w.value("width",      cfg.window_width);
            cfg.window_height = w.value("height",     cfg.window_height);
            cfg.title         = w.value("title",      cfg.title);
            cfg.target_fps    = w.value("target_fps", cfg.target_fps);
        }
        if (j.contains("maze")) {
            const auto& m = j["maze"];
            cfg.maze_rows = m.value("rows", cfg.maze_rows);
            cfg.maze_cols = m.value("cols", cfg.maze_cols);
            cfg.seed      = m.value("seed", cfg.seed);
        }
        if (j.contains("tweaks")) {
            const auto& t = j["tweaks"];
            cfg.tweaks_path          = t.value("path",          cfg.tweaks_path);
            cfg.tweaks_poll_interval = t.value("poll_interval", cfg.tweaks_poll_interval);
        }

        if (cfg.maze_rows < 1 || cfg.maze_cols < 1)
            throw std::runtime_error("ConfigLoader: maze dimensions must be positive");

        out = std::move(cfg);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ConfigLoader::load(AppConfig& out, const std::string& path) {
    std::string content;
    if (!read_file(path, content)) return false;
    return load_from_string(out, content);
}

// ---------------------------------------------------------------------------
// Tweaks
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(Tweaks& out, const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        Tweaks t = out;

        t.ambient_light_intensity = j.value("ambient_light_intensity", t.ambient_light_intensity);
        read_color(j, "wall_color",    t.wall_color);
        read_color(j, "floor_color",   t.floor_color);
        read_color(j, "ceiling_color", t.ceiling_color);
        read_color(j, "exit_color",    t.exit_color);
        t.mouse_sensitivity = j.value("mouse_sensitivity", t.mouse_sensitivity);
        t.mouse_delta_cap   = j.value("mouse_delta_cap",   t.mouse_delta_cap);
        t.move_speed        = j.value("move_speed",        t.move_speed);
        t.turn_speed        = j.value("turn_speed",        t.turn_speed);
        t.player_radius     = j.value("player_radius",     t.player_radius);
        t.wall_height       = j.value("wall_height",       t.wall_height);

        // The collision circle must fit inside a cell.
        if (t.player_radius <= 0.0f || t.player_radius >= 0.5f)
            throw std::runtime_error("ConfigLoader: player_radius out of range");

        out = t;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ConfigLoader::load(Tweaks& out, const std::string& path) {
    std::string content;
    if (!read_file(path, content)) return false;
    return load_from_string(out, content);
}

#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../core/corridor.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../systems/chunk_streaming.hpp"
#include "../systems/control_mode.hpp"
#include "../systems/maze_setup.hpp"
#include "../systems/player_control.hpp"
#include "../systems/tweaks.hpp"
#include "../systems/wall_collision.hpp"
#include "window_module.hpp"
#include <cstdint>
#include <random>
#include <string>

// ---------------------------------------------------------------------------
// MazeModule
//
// The game itself, headless. Starts in Preload, moves to Play once tweaks are
// loaded, and streams an endless chain of maze chunks while in Play. R or a
// tweaks file change re-enters Play with a fresh first chunk.
//
// Play-stage Update order matters: ReadInput -> UpdateHover -> AutoWalk ->
// Look -> Move -> WallCollision -> Track -> SpawnNext -> DespawnTraversed ->
// Stats. Collision must see this tick's movement, and the chunk consumers
// read Track's events.
//
// Reads AppConfig (chunk size, seed) if the host inserted one. Adds its rows
// to the DebugPanel when DebugModule was installed first.
// ---------------------------------------------------------------------------

struct MazeModule {
    static void install(corridor::AppBuilder& app) {
        using corridor::Stage;

        const auto& cfg = corridor::init_resource<AppConfig>(app.world());
        const std::uint32_t seed = cfg.seed != 0 ? cfg.seed : std::random_device{}();
        app.insert_resource(MazeRng{std::mt19937(seed)});
        app.init_resource<PlayStats>();
        app.add_module<WindowModule>();

        app.add_event<ChunkEntered>()
           .add_event<ChunkExited>()
           .add_event<ControlModeChanged>()
           .add_event<TweaksReloaded>();

        app.track_component<Position>()
           .track_component<PlayerTag>()
           .track_component<NoClip>()
           .track_component<Chunk>()
           .track_component<WallSegment>()
           .track_component<FloorTile>()
           .track_component<Reset>();

        app.set_initial_state(GameState::Preload);
        app.add_startup_system(TweaksSystem::Load, "tweaks_load");
        app.add_system_stateful(Stage::Update, GameState::Preload, TweaksSystem::WaitUntilReady,
                                "wait_for_tweaks");

        app.on_enter_state(GameState::Play, MazeSetupSystem::Enter, "maze_enter");
        app.on_exit_state(GameState::Play, MazeSetupSystem::Exit, "maze_exit");

        app.add_system_stateful(Stage::Update, GameState::Play, ControlModeSystem::ReadInput, "control_mode_input");
        app.add_system_stateful(Stage::Update, GameState::Play, ControlModeSystem::UpdateHover, "hover_mode");
        app.add_system_stateful(Stage::Update, GameState::Play, ControlModeSystem::AutoWalk, "auto_walk");
        app.add_system_stateful(Stage::Update, GameState::Play, PlayerControlSystem::Look, "player_look");
        app.add_system_stateful(Stage::Update, GameState::Play, PlayerControlSystem::Move, "player_move");
        app.add_system_stateful(Stage::Update, GameState::Play, WallCollisionSystem::Update, "wall_collision");
        app.add_system_stateful(Stage::Update, GameState::Play, ChunkSystem::Track, "track_chunk");
        app.add_system_stateful(Stage::Update, GameState::Play, ChunkSystem::SpawnNext, "spawn_chunk");
        app.add_system_stateful(Stage::Update, GameState::Play, ChunkSystem::DespawnTraversed, "despawn_chunks");
        app.add_system_stateful(Stage::Update, GameState::Play, ChunkSystem::Stats, "chunk_stats");
        app.add_system_stateful(Stage::PostUpdate, GameState::Play, TweaksSystem::Watch, "tweaks_watch");
        app.add_system_stateful(Stage::PostUpdate, GameState::Play, MazeSetupSystem::Restart, "restart");

        if (auto* panel = app.world().try_resource<DebugPanel>()) add_debug_rows(*panel, app.world());
    }

private:
    static void add_debug_rows(DebugPanel& panel, ecs::World& world) {
        panel.watch("Engine", "Tick", [&world]() {
            return std::to_string(world.resource<corridor::FrameClock>().frame);
        });
        panel.watch("Engine", "State", [&world]() {
            auto* state = world.try_resource<corridor::AppState>();
            if (!state) return std::string("-");
            return std::string(game_state_name(state->get<GameState>()));
        });
        panel.watch("Engine", "Archetypes", [&world]() {
            return std::to_string(world.resource<corridor::ArchetypeTracker>().generation());
        });
        panel.watch("Maze", "Mode", [&world]() {
            auto* mode = world.try_resource<ControlModeResource>();
            return std::string(mode ? control_mode_name(mode->mode) : "-");
        });
        panel.watch("Maze", "Chunk", [&world]() {
            auto* current = world.try_resource<CurrentChunk>();
            if (!current || !current->entity) return std::string("-");
            return std::to_string(current->index);
        });
        panel.watch("Maze", "Loaded", [&world]() {
            int n = 0;
            world.each<Chunk>([&](ecs::Entity, Chunk&) { ++n; });
            return std::to_string(n);
        });
        panel.watch("Maze", "Traversed", [&world]() {
            return std::to_string(world.resource<PlayStats>().chunks_total);
        });
    }
};

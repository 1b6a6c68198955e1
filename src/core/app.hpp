#pragma once
#include "app_state.hpp"
#include "archetypes.hpp"
#include "context.hpp"
#include "events.hpp"
#include "frame_clock.hpp"
#include "resources.hpp"
#include "stage.hpp"
#include "system.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>

namespace corridor {

class App;
class AppBuilder;

using Runner = std::function<void(App)>;
using Plugin = std::function<void(AppBuilder&)>;

/**
 * @brief A frozen, runnable application.
 *
 * @details Produced by AppBuilder::build(). Owns the world and the sorted
 * system list. The host calls tick() once per frame for as long as it wants
 * the application to run. Everything happens on the calling thread.
 */
class App {
public:
    static AppBuilder create();

    App(App&&) = default;
    App& operator=(App&&) = default;
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Runs one tick.
     * @details
     * 1. Snapshots AppState::current.
     * 2. Runs eligible systems in stage order, flushing deferred commands
     *    after each one.
     * 3. Notifies systems of archetype signatures discovered since the last
     *    tick.
     * 4. Advances the FrameClock.
     * 5. Applies at most one pending state transition (Exit, flip, Enter).
     */
    void tick();

    ecs::World& world() { return *world_; }

    template <typename T>
    T& resource() { return require_resource<T>(*world_); }

    template <typename T>
    T* try_resource() { return world_->try_resource<T>(); }

    template <typename T>
    Events<T>& events() { return resource<Events<T>>(); }

    // Host-side emission, e.g. window events gathered between ticks.
    template <typename T>
    void emit_event(T event) { events<T>().send(std::move(event)); }

    AppState& state() { return resource<AppState>(); }

    std::uint64_t frame() { return resource<FrameClock>().frame; }

    std::size_t system_count() const { return systems_.size(); }
    std::size_t listener_count() const { return listeners_.size(); }

private:
    friend class AppBuilder;

    App(std::unique_ptr<ecs::World> world,
        std::vector<SystemDescriptor> systems,
        std::vector<SystemDescriptor> listeners);

    void notify_archetypes();
    void advance_epoch();
    void apply_transition();
    void run_listeners(SystemKind edge, StateId state);

    std::unique_ptr<ecs::World>   world_;
    std::vector<SystemDescriptor> systems_;   // Stateless / Stateful, sorted by stage
    std::vector<SystemDescriptor> listeners_; // OnEnter / OnExit, registration order
    std::uint64_t                 notified_generation_ = 0;
};

/**
 * @brief Accumulates registrations, then freezes them into an App.
 *
 * @details Registration methods return the builder for chaining. Resources
 * are inserted into the builder's world immediately, so later plugins can
 * read what earlier ones inserted.
 */
class AppBuilder {
public:
    AppBuilder();

    AppBuilder(AppBuilder&&) = default;
    AppBuilder& operator=(AppBuilder&&) = default;
    AppBuilder(const AppBuilder&) = delete;
    AppBuilder& operator=(const AppBuilder&) = delete;

    // -- Systems --

    // Update stage, every tick.
    AppBuilder& add_system(SystemFunc fn, std::string name = {});
    AppBuilder& add_system_to_stage(Stage stage, SystemFunc fn, std::string name = {});
    AppBuilder& add_startup_system(SystemFunc fn, std::string name = {});

    // Runs every tick with an archetype callback for incremental query caches.
    AppBuilder& add_archetype_system(Stage stage, SystemFunc fn, ArchetypeFunc on_archetype,
                                     std::string name = {});

    AppBuilder& add_system_descriptor(SystemDescriptor desc);

    template <typename S>
    AppBuilder& add_system_stateful(Stage stage, S state, SystemFunc fn, std::string name = {}) {
        return add_system_descriptor(
            {std::move(name), std::move(fn), nullptr, stage, SystemKind::Stateful, state_id(state)});
    }

    template <typename S>
    AppBuilder& on_enter_state(S state, SystemFunc fn, std::string name = {}) {
        return add_system_descriptor(
            {std::move(name), std::move(fn), nullptr, Stage::Update, SystemKind::OnEnter, state_id(state)});
    }

    template <typename S>
    AppBuilder& on_exit_state(S state, SystemFunc fn, std::string name = {}) {
        return add_system_descriptor(
            {std::move(name), std::move(fn), nullptr, Stage::Update, SystemKind::OnExit, state_id(state)});
    }

    template <typename S>
    AppBuilder& set_initial_state(S state) {
        initial_state_ = state_id(state);
        return *this;
    }

    // -- Events --

    // Inserts an empty Events<T> and its clearing system at Stage::EventReset.
    // Calling it again for the same T does nothing.
    template <typename T>
    AppBuilder& add_event() {
        if (!event_types_.insert(ecs::component_id<Events<T>>()).second) return *this;
        insert_resource(Events<T>{});
        return add_system_to_stage(
            Stage::EventReset,
            [](Context& ctx) { ctx.events<T>().clear(); },
            std::string("clear_events<") + typeid(T).name() + ">");
    }

    // -- Resources --

    template <typename T>
    AppBuilder& insert_resource(T&& value) {
        corridor::insert_resource(world(), std::forward<T>(value));
        return *this;
    }

    template <typename T>
    AppBuilder& init_resource() {
        corridor::init_resource<T>(world());
        return *this;
    }

    // -- Archetype tracking --

    template <typename T>
    AppBuilder& track_component() {
        require_resource<ArchetypeTracker>(world()).track<T>(world());
        return *this;
    }

    // -- Composition --

    AppBuilder& add_plugin(const Plugin& plugin);

    template <typename M>
    AppBuilder& add_module() {
        M::install(*this);
        return *this;
    }

    AppBuilder& set_runner(Runner runner);

    ecs::World& world();

    /**
     * @brief Freezes the builder into a runnable App. May be called once.
     * @details Runs startup systems (flushing after each), inserts AppState
     * with the initial state, stable-sorts systems by stage, then runs the
     * initial state's OnEnter listeners.
     */
    App build();

    // Builds, then hands the App to the runner. Without a runner the App is
    // ticked once.
    void run();

private:
    void ensure_open(const char* op) const;

    std::unique_ptr<ecs::World>              world_;
    std::vector<SystemDescriptor>            startup_;
    std::vector<SystemDescriptor>            systems_;
    std::vector<SystemDescriptor>            listeners_;
    std::unordered_set<ecs::ComponentTypeID> event_types_;
    StateId                                  initial_state_ = 0;
    Runner                                   runner_;
    bool                                     built_ = false;
};

} // namespace corridor

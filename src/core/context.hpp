#pragma once
#include "app_state.hpp"
#include "events.hpp"
#include "frame_clock.hpp"
#include "resources.hpp"
#include <ecs/ecs.hpp>
#include <utility>
#include <vector>

namespace corridor {

// ---------------------------------------------------------------------------
// Context: the handle every system receives.
//
// Wraps the world for the duration of one system call. Structural changes go
// through commands() and are applied by the scheduler as soon as the system
// returns, so the next system always sees them. Resource lookups through
// resource<T>() are fatal when T was never inserted.
// ---------------------------------------------------------------------------

class Context {
public:
    explicit Context(ecs::World& world) : world_(world) {}

    ecs::World& world() { return world_; }

    // -- Resources --

    template <typename T>
    T& resource() { return require_resource<T>(world_); }

    template <typename T>
    T* try_resource() { return world_.try_resource<T>(); }

    template <typename T>
    bool has_resource() const { return world_.has_resource<T>(); }

    template <typename T>
    void insert_resource(T&& value) { corridor::insert_resource(world_, std::forward<T>(value)); }

    template <typename T>
    T& init_resource() { return corridor::init_resource<T>(world_); }

    // -- Events --

    template <typename T>
    Events<T>& events() { return resource<Events<T>>(); }

    template <typename T>
    void emit(T event) { events<T>().send(std::move(event)); }

    template <typename T>
    const std::vector<T>& read() { return events<T>().read(); }

    // -- Deferred structural changes --

    ecs::CommandBuffer& commands() { return world_.deferred(); }

    // -- State --

    AppState& state() { return resource<AppState>(); }

    template <typename S>
    S current_state() { return state().get<S>(); }

    template <typename S>
    void schedule_transition(S next) { state().schedule_transition(next); }

    // -- Time --

    FrameClock& clock() { return resource<FrameClock>(); }
    float       delta() { return clock().delta; }

private:
    ecs::World& world_;
};

} // namespace corridor

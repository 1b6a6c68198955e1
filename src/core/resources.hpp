#pragma once
#include <ecs/ecs.hpp>
#include <cassert>
#include <type_traits>
#include <typeinfo>
#include <utility>

// Debug-only check for internal invariants. Mirrors ECS_ASSERT.
#ifndef CORRIDOR_ASSERT
#define CORRIDOR_ASSERT(expr, msg) assert((expr) && (msg))
#endif

namespace corridor {
namespace detail {

// Prints "corridor: fatal: <what> (<detail>)" to stderr and aborts.
// Used for configuration bugs such as a resource that was never inserted.
[[noreturn]] void fatal(const char* what, const char* detail);

} // namespace detail

// ---------------------------------------------------------------------------
// Resource store helpers over ecs::World.
//
// The world keeps one instance per type. require_resource() is the fatal
// lookup path: a missing resource means a module was not installed, and the
// process stops at first use in every build type (ecs::World::resource<T>()
// only asserts in debug builds).
// ---------------------------------------------------------------------------

template <typename T>
T& require_resource(ecs::World& world) {
    if (auto* r = world.try_resource<T>()) return *r;
    detail::fatal("missing resource", typeid(T).name());
}

// Insert-or-replace.
template <typename T>
void insert_resource(ecs::World& world, T&& value) {
    world.set_resource(std::forward<T>(value));
}

// Insert only if absent. Types constructible from the world are built with
// it, everything else is value-initialised.
template <typename T>
T& init_resource(ecs::World& world) {
    if (!world.has_resource<T>()) {
        if constexpr (std::is_constructible_v<T, ecs::World&>) {
            world.set_resource(T(world));
        } else {
            world.set_resource(T{});
        }
    }
    return require_resource<T>(world);
}

} // namespace corridor

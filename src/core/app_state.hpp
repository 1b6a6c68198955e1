#pragma once
#include <cstdint>
#include <optional>
#include <type_traits>

namespace corridor {

// Application states are closed enums chosen by the application. The
// scheduler stores them as their underlying integer value.
using StateId = std::uint32_t;

template <typename S>
constexpr StateId state_id(S s) {
    static_assert(std::is_enum_v<S>, "application states must be enums");
    return static_cast<StateId>(s);
}

// ---------------------------------------------------------------------------
// AppState: current mode plus at most one pending transition.
//
// Stored as a World resource; inserted by AppBuilder::build() with the
// initial state. schedule_transition() only records intent. App::tick()
// applies the pending transition once per tick, after the stage sweep. When
// several requests arrive before that point the last one wins.
// ---------------------------------------------------------------------------

struct AppState {
    StateId                current = 0;
    std::optional<StateId> pending;

    template <typename S>
    S get() const { return static_cast<S>(current); }

    template <typename S>
    bool is(S s) const { return current == state_id(s); }

    template <typename S>
    void schedule_transition(S next) { pending = state_id(next); }

    void schedule_transition_id(StateId next) { pending = next; }
};

} // namespace corridor

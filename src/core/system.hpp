#pragma once
#include "app_state.hpp"
#include "archetypes.hpp"
#include "context.hpp"
#include "stage.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace corridor {

using SystemFunc    = std::function<void(Context&)>;
using ArchetypeFunc = std::function<void(Context&, const ArchetypeSignature&)>;

// When a system is eligible to run.
enum class SystemKind : std::uint8_t {
    Startup,   // once, during AppBuilder::build()
    Stateless, // every tick
    Stateful,  // every tick while AppState::current == state
    OnEnter,   // when entering state
    OnExit,    // when leaving state
};

/**
 * @brief One registered unit of behaviour.
 * @details Immutable once handed to the builder. `on_archetype`, when set, is
 * called once for every newly observed archetype signature so the system can
 * extend its own query cache.
 */
struct SystemDescriptor {
    std::string   name;
    SystemFunc    run;
    ArchetypeFunc on_archetype;
    Stage         stage = Stage::Update;
    SystemKind    kind  = SystemKind::Stateless;
    StateId       state = 0;
};

} // namespace corridor

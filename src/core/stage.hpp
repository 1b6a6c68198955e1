#pragma once
#include <cstdint>

namespace corridor {

// ---------------------------------------------------------------------------
// Stage: ordered phase of a tick.
//
// Systems execute in ascending Stage order; registration order breaks ties.
// EventReset sits strictly after Last and hosts only the per-type event
// clearing systems installed by AppBuilder::add_event<T>().
// ---------------------------------------------------------------------------

enum class Stage : std::uint8_t {
    First,
    AssetLoad,
    AssetEvents,
    PreUpdate,
    Update,
    PostUpdate,
    PreRender,
    Render,
    Last,
    EventReset,
};

inline const char* stage_name(Stage s) {
    switch (s) {
    case Stage::First:       return "First";
    case Stage::AssetLoad:   return "AssetLoad";
    case Stage::AssetEvents: return "AssetEvents";
    case Stage::PreUpdate:   return "PreUpdate";
    case Stage::Update:      return "Update";
    case Stage::PostUpdate:  return "PostUpdate";
    case Stage::PreRender:   return "PreRender";
    case Stage::Render:      return "Render";
    case Stage::Last:        return "Last";
    case Stage::EventReset:  return "EventReset";
    }
    return "?";
}

} // namespace corridor

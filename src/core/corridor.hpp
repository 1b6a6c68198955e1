#pragma once

/**
 * @file corridor.hpp
 * @brief Scheduler entry point: builder, tick driver, resources, events,
 * states and archetype tracking.
 */

#include "app.hpp"
#include "app_state.hpp"
#include "archetypes.hpp"
#include "context.hpp"
#include "events.hpp"
#include "frame_clock.hpp"
#include "resources.hpp"
#include "stage.hpp"
#include "system.hpp"

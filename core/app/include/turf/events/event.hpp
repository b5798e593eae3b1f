#pragma once

#include "turf/events/evaluation_events.hpp"

#include <variant>

namespace turf {

// -----------------------------------------------------------------------------
// EngineEvent (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. Adding a notification means
// adding it here; subscribers dispatch with std::get_if or the typed
// EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using EngineEvent = std::variant<
    FoldStateEvent,
    FoldSkippedEvent,
    NumericalIncidentEvent,
    RatingPassEvent>;

}  // namespace turf

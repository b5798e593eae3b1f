#pragma once

#include "turf/domain/entity.hpp"
#include "turf/domain/event.hpp"

#include <cstdint>

namespace turf {
namespace domain {

// -----------------------------------------------------------------------------
// RatingSnapshot — one immutable entry in an entity's rating history
// -----------------------------------------------------------------------------
//
// @brief  The rating of an entity effective *after* the event identified by
//         (timestamp_ms, event_id).
//
// @details
// A snapshot is produced once by the RatingUpdateEngine and never rewritten.
// The feature assembler may only use a snapshot for an event whose
// timestamp is strictly greater than snapshot.timestamp_ms.
//
//   rating       — the value consumed as a feature. For competitors this is
//                  the exponentially weighted performance; for agents it is
//                  the shrunk value.
//   raw_rating   — the un-shrunk recursion state. Equal to rating for
//                  competitors. Agents continue their recursion from this
//                  value so shrinkage does not compound event over event.
//   observations — number of events folded into this history so far,
//                  including the one that produced this snapshot.
// -----------------------------------------------------------------------------
struct RatingSnapshot {
  TimestampMs timestamp_ms{0};
  EventId event_id{0};
  double rating{0.0};
  double raw_rating{0.0};
  std::uint32_t observations{0};

  EventKey key() const { return EventKey{timestamp_ms, event_id}; }
};

// -----------------------------------------------------------------------------
// RatingRow — the persisted (entity, timestamp, rating) table row
// -----------------------------------------------------------------------------
struct RatingRow {
  EntityKey entity;
  TimestampMs timestamp_ms{0};
  EventId event_id{0};
  double rating{0.0};
};

}  // namespace domain
}  // namespace turf

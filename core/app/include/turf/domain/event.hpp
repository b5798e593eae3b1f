#pragma once

#include "turf/domain/entity.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace turf {
namespace domain {

using EventId = std::uint64_t;
using EntrantId = std::uint64_t;

// Milliseconds since the Unix epoch. Integer milliseconds keep the total
// order exact; no floating-point time is used anywhere in the engine.
using TimestampMs = std::int64_t;

// -----------------------------------------------------------------------------
// EventKey — total order over events
// -----------------------------------------------------------------------------
//
// @brief  (timestamp, event_id) pair. Events are ordered by timestamp and
//         ties are broken by event id, which makes the traversal order of
//         the rating pass deterministic.
//
// @details
// Leakage checks compare plain timestamps (strictly-less-than), not keys:
// two races run at the same timestamp never see each other's outcome even
// though the key order places one of them first.
// -----------------------------------------------------------------------------
struct EventKey {
  TimestampMs timestamp_ms{0};
  EventId event_id{0};

  bool operator<(const EventKey& other) const {
    return std::tie(timestamp_ms, event_id) <
           std::tie(other.timestamp_ms, other.event_id);
  }
  bool operator==(const EventKey& other) const {
    return timestamp_ms == other.timestamp_ms && event_id == other.event_id;
  }
  bool operator!=(const EventKey& other) const { return !(*this == other); }
  bool operator<=(const EventKey& other) const { return !(other < *this); }
};

std::string describe(const EventKey& key);

// -----------------------------------------------------------------------------
// OutcomeStatus
// -----------------------------------------------------------------------------
// Pending → Settled, exactly once. Settled events are the only ones the
// rating pass and the model training ever consume.
// -----------------------------------------------------------------------------
enum class OutcomeStatus : std::uint8_t { Pending, Settled };

// -----------------------------------------------------------------------------
// StaticAttributes — everything known before the off
// -----------------------------------------------------------------------------
// Missing values stay std::nullopt; the model's standardiser imputes them.
// -----------------------------------------------------------------------------
struct StaticAttributes {
  std::optional<double> age;
  std::optional<double> weight_lbs;
  std::optional<double> draw;
};

// -----------------------------------------------------------------------------
// EntrantOutcome
// -----------------------------------------------------------------------------
// A finisher carries finish_position in 1..k. A non-finisher (pulled up,
// fell, unseated, ...) has no position and non_finisher == true. Pending
// entrants have neither.
// -----------------------------------------------------------------------------
struct EntrantOutcome {
  std::optional<int> finish_position;
  bool non_finisher{false};

  bool finished() const { return finish_position.has_value(); }
};

// -----------------------------------------------------------------------------
// Entrant — one runner's record within one Event
// -----------------------------------------------------------------------------
struct Entrant {
  EntrantId entrant_id{0};
  EntityId competitor_id{0};
  std::vector<AgentRef> agents;       // Zero or more (jockey, trainer)
  StaticAttributes attributes;
  EntrantOutcome outcome;

  // Decimal odds observed in the betting market. Never used as a feature;
  // it is carried through to the prediction table for the external
  // market-comparison step.
  std::optional<double> market_price;

  // Returns the id of the first agent of the given kind, if any.
  std::optional<EntityId> agent(EntityKind kind) const;
};

// -----------------------------------------------------------------------------
// Event — one race
// -----------------------------------------------------------------------------
//
// @brief  A multi-entrant contest with a single timestamp, a declared field
//         size, and an outcome that is settled exactly once.
//
// @details
// Invariants (checked by validate()):
//   - at least one entrant, and entrants.size() == n_runners;
//   - entrant ids and competitor ids are unique within the event;
//   - Pending: no entrant carries a finish position or non-finish flag;
//   - Settled: every entrant is either a finisher or a non-finisher, never
//     both, and finisher positions form the permutation 1..k where k is
//     the number of finishers.
//
// stratum partitions events into disjoint groups (race type / discipline)
// for the optional per-stratum rating histories.
// -----------------------------------------------------------------------------
struct Event {
  EventId event_id{0};
  TimestampMs timestamp_ms{0};
  std::string stratum;
  std::string racecourse;
  std::optional<double> distance;
  std::size_t n_runners{0};
  std::vector<Entrant> entrants;
  OutcomeStatus status{OutcomeStatus::Pending};

  EventKey key() const { return EventKey{timestamp_ms, event_id}; }
  bool isSettled() const { return status == OutcomeStatus::Settled; }

  std::size_t finisherCount() const;

  // Index of the entrant with finish_position == 1, if the event is
  // settled and has at least one finisher.
  std::optional<std::size_t> winnerIndex() const;

  // Entrant indices of finishers ordered by finish position (1 first).
  // Non-finishers are not part of the sequence.
  std::vector<std::size_t> finishingOrder() const;

  // -------------------------------------------------------------------------
  // settle(outcomes)
  // -------------------------------------------------------------------------
  // @brief  Transitions the event from Pending to Settled.
  //
  // @param  outcomes  One outcome per entrant, in entrant order.
  //
  // @details
  // Throws DegenerateInputError if the event is already settled, if the
  // outcome count does not match the field, or if the resulting outcome
  // violates the rank invariants. On failure the event is left unchanged.
  // -------------------------------------------------------------------------
  void settle(const std::vector<EntrantOutcome>& outcomes);

  // Throws DegenerateInputError describing the first violated invariant.
  void validate() const;
};

}  // namespace domain
}  // namespace turf

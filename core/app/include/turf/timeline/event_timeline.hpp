#pragma once

#include "turf/domain/event.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// EventTimeline — validated, chronologically ordered sequence of races
// -----------------------------------------------------------------------------
//
// @brief  Owns every Event handed to the core and keeps them sorted by
//         EventKey (timestamp, then event id).
//
// @details
// The timeline is the foundation of the pipeline. The RatingUpdateEngine
// walks it front to back; planFolds() slices it into train/test
// windows; the evaluator looks events up by id.
//
// Ingestion rejects structurally invalid events up front (zero entrants,
// field-size mismatch, duplicate ids, broken rank permutations) so that no
// downstream component ever has to special-case them. The cleaning
// collaborator is expected to have dropped malformed records already; any
// that slip through abort ingestion with a DegenerateInputError.
//
// After ingestion the only permitted mutation is settle(), which moves a
// Pending event to Settled exactly once.
//
// Thread model:
//   Not internally synchronised. Build and settle on one thread, then share
//   by const reference; all const members are safe for concurrent readers.
// -----------------------------------------------------------------------------
class EventTimeline {
 public:
  EventTimeline() = default;

  // Builds a timeline from an unordered collection. Equivalent to
  // default-constructing and calling ingest().
  explicit EventTimeline(std::vector<domain::Event> events);

  // -------------------------------------------------------------------------
  // ingest(events)
  // -------------------------------------------------------------------------
  // @brief  Validates and merges events into the timeline.
  //
  // @param  events  Events in any order.
  //
  // @details
  // Every event is validated (Event::validate) and its id checked against
  // the ids already present. The merged sequence is re-sorted by EventKey
  // with a stable sort. If any event is rejected nothing is merged.
  //
  // Side-effects: Invalidates indices previously returned by indexOf().
  // -------------------------------------------------------------------------
  void ingest(std::vector<domain::Event> events);

  // -------------------------------------------------------------------------
  // settle(event_id, outcomes)
  // -------------------------------------------------------------------------
  // @brief  Settles a pending event in place.
  //
  // @details
  // Throws DegenerateInputError for an unknown id or an event that has
  // already been settled (see Event::settle).
  // -------------------------------------------------------------------------
  void settle(domain::EventId event_id,
              const std::vector<domain::EntrantOutcome>& outcomes);

  const std::vector<domain::Event>& events() const { return events_; }
  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }
  const domain::Event& at(std::size_t index) const { return events_.at(index); }

  const domain::Event* find(domain::EventId event_id) const;
  std::optional<std::size_t> indexOf(domain::EventId event_id) const;

  // Index of the first event with timestamp >= t (size() if none).
  // Binary search over the sorted sequence.
  std::size_t firstIndexAtOrAfter(domain::TimestampMs t) const;

  // Settled / pending events in timeline order, by pointer into events().
  std::vector<const domain::Event*> settledEvents() const;
  std::vector<const domain::Event*> pendingEvents() const;

 private:
  void reindex();

  std::vector<domain::Event> events_;
  std::unordered_map<domain::EventId, std::size_t> index_;
};

}  // namespace turf

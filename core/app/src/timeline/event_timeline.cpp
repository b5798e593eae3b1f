#include "turf/timeline/event_timeline.hpp"
#include "turf/errors.hpp"

#include <algorithm>
#include <unordered_set>

namespace turf {

EventTimeline::EventTimeline(std::vector<domain::Event> events) {
  ingest(std::move(events));
}

// -----------------------------------------------------------------------------
// ingest: validate everything first, merge only if all events pass
// -----------------------------------------------------------------------------
void EventTimeline::ingest(std::vector<domain::Event> events) {
  std::unordered_set<domain::EventId> incoming;
  incoming.reserve(events.size());

  for (const auto& event : events) {
    event.validate();
    if (index_.count(event.event_id) != 0 ||
        !incoming.insert(event.event_id).second) {
      throw DegenerateInputError("duplicate " + domain::describe(event.key()));
    }
  }

  events_.reserve(events_.size() + events.size());
  for (auto& event : events) {
    events_.push_back(std::move(event));
  }

  // Ids are unique, so keys never compare equal.
  std::stable_sort(events_.begin(), events_.end(),
                   [](const domain::Event& a, const domain::Event& b) {
                     return a.key() < b.key();
                   });
  reindex();
}

// -----------------------------------------------------------------------------
// settle
// -----------------------------------------------------------------------------
void EventTimeline::settle(domain::EventId event_id,
                           const std::vector<domain::EntrantOutcome>& outcomes) {
  auto it = index_.find(event_id);
  if (it == index_.end()) {
    throw DegenerateInputError("cannot settle unknown event#" +
                               std::to_string(event_id));
  }
  events_[it->second].settle(outcomes);
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
const domain::Event* EventTimeline::find(domain::EventId event_id) const {
  auto it = index_.find(event_id);
  return (it != index_.end()) ? &events_[it->second] : nullptr;
}

std::optional<std::size_t> EventTimeline::indexOf(
    domain::EventId event_id) const {
  auto it = index_.find(event_id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t EventTimeline::firstIndexAtOrAfter(domain::TimestampMs t) const {
  auto it = std::lower_bound(
      events_.begin(), events_.end(), t,
      [](const domain::Event& e, domain::TimestampMs value) {
        return e.timestamp_ms < value;
      });
  return static_cast<std::size_t>(it - events_.begin());
}

std::vector<const domain::Event*> EventTimeline::settledEvents() const {
  std::vector<const domain::Event*> out;
  for (const auto& e : events_) {
    if (e.isSettled()) {
      out.push_back(&e);
    }
  }
  return out;
}

std::vector<const domain::Event*> EventTimeline::pendingEvents() const {
  std::vector<const domain::Event*> out;
  for (const auto& e : events_) {
    if (!e.isSettled()) {
      out.push_back(&e);
    }
  }
  return out;
}

void EventTimeline::reindex() {
  index_.clear();
  index_.reserve(events_.size());
  for (std::size_t i = 0; i < events_.size(); ++i) {
    index_.emplace(events_[i].event_id, i);
  }
}

}  // namespace turf

#include "turf/domain/event.hpp"
#include "turf/errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace turf {
namespace domain {

std::string describe(const EventKey& key) {
  std::ostringstream os;
  os << "event#" << key.event_id << " (t=" << key.timestamp_ms << "ms)";
  return os.str();
}

// -----------------------------------------------------------------------------
// Entrant::agent
// -----------------------------------------------------------------------------
std::optional<EntityId> Entrant::agent(EntityKind kind) const {
  for (const auto& ref : agents) {
    if (ref.kind == kind) {
      return ref.id;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Outcome queries
// -----------------------------------------------------------------------------
std::size_t Event::finisherCount() const {
  return static_cast<std::size_t>(
      std::count_if(entrants.begin(), entrants.end(),
                    [](const Entrant& e) { return e.outcome.finished(); }));
}

std::optional<std::size_t> Event::winnerIndex() const {
  if (!isSettled()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < entrants.size(); ++i) {
    const auto& pos = entrants[i].outcome.finish_position;
    if (pos && *pos == 1) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<std::size_t> Event::finishingOrder() const {
  std::vector<std::size_t> order;
  if (!isSettled()) {
    return order;
  }
  for (std::size_t i = 0; i < entrants.size(); ++i) {
    if (entrants[i].outcome.finished()) {
      order.push_back(i);
    }
  }
  std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
    return *entrants[a].outcome.finish_position <
           *entrants[b].outcome.finish_position;
  });
  return order;
}

// -----------------------------------------------------------------------------
// settle: Pending → Settled, validated before committing
// -----------------------------------------------------------------------------
void Event::settle(const std::vector<EntrantOutcome>& outcomes) {
  if (isSettled()) {
    throw DegenerateInputError(describe(key()) + " is already settled");
  }
  if (outcomes.size() != entrants.size()) {
    std::ostringstream os;
    os << describe(key()) << " received " << outcomes.size()
       << " outcomes for " << entrants.size() << " entrants";
    throw DegenerateInputError(os.str());
  }

  // Validate on a copy so a rejected settlement leaves this event Pending.
  Event candidate = *this;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    candidate.entrants[i].outcome = outcomes[i];
  }
  candidate.status = OutcomeStatus::Settled;
  candidate.validate();

  *this = std::move(candidate);
}

// -----------------------------------------------------------------------------
// validate: structural invariants of a single event
// -----------------------------------------------------------------------------
void Event::validate() const {
  const std::string where = describe(key());

  if (entrants.empty()) {
    throw DegenerateInputError(where + " has zero entrants");
  }
  if (entrants.size() != n_runners) {
    std::ostringstream os;
    os << where << " declares " << n_runners << " runners but lists "
       << entrants.size() << " entrants";
    throw DegenerateInputError(os.str());
  }

  std::set<EntrantId> entrant_ids;
  std::set<EntityId> competitor_ids;
  for (const auto& e : entrants) {
    if (!entrant_ids.insert(e.entrant_id).second) {
      throw DegenerateInputError(where + " lists entrant " +
                                 std::to_string(e.entrant_id) + " twice");
    }
    if (!competitor_ids.insert(e.competitor_id).second) {
      throw DegenerateInputError(where + " lists competitor " +
                                 std::to_string(e.competitor_id) + " twice");
    }
  }

  if (!isSettled()) {
    for (const auto& e : entrants) {
      if (e.outcome.finished() || e.outcome.non_finisher) {
        throw DegenerateInputError(where +
                                   " is pending but carries an outcome for "
                                   "entrant " +
                                   std::to_string(e.entrant_id));
      }
    }
    return;
  }

  // Settled: finisher ranks must be exactly {1..k}.
  std::vector<int> ranks;
  ranks.reserve(entrants.size());
  for (const auto& e : entrants) {
    const bool finished = e.outcome.finished();
    if (finished == e.outcome.non_finisher) {
      throw DegenerateInputError(
          where + " entrant " + std::to_string(e.entrant_id) +
          (finished ? " is both a finisher and a non-finisher"
                    : " has neither a finish position nor a non-finish flag"));
    }
    if (finished) {
      ranks.push_back(*e.outcome.finish_position);
    }
  }
  std::sort(ranks.begin(), ranks.end());
  for (std::size_t i = 0; i < ranks.size(); ++i) {
    if (ranks[i] != static_cast<int>(i + 1)) {
      std::ostringstream os;
      os << where << " finish positions are not a permutation of 1.."
         << ranks.size() << " (found " << ranks[i] << " at slot " << i + 1
         << ")";
      throw DegenerateInputError(os.str());
    }
  }
}

}  // namespace domain
}  // namespace turf

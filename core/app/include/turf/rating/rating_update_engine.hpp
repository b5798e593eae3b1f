#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/entity.hpp"
#include "turf/domain/event.hpp"
#include "turf/rating/rating_store.hpp"
#include "turf/rating/update_strategy.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace turf {

class EventTimeline;

// Counters returned by a sequential rating pass.
struct RatingPassStats {
  std::size_t events_applied{0};
  std::size_t pending_skipped{0};
  std::size_t snapshots_appended{0};
  bool cancelled{false};
};

// -----------------------------------------------------------------------------
// RatingUpdateEngine — folds finished races into the RatingStore
// -----------------------------------------------------------------------------
//
// @brief  Computes a performance score for every entrant of a settled event
//         and appends one post-event snapshot per involved entity.
//
// @details
// For each entrant of the event:
//
//   1. perf = UpdateStrategy::performance(event, entrant), in [0, 1].
//   2. The competitor's prior is its latest committed snapshot, or the
//      cold-start rating if none exists. The watermark guarantees every
//      committed snapshot precedes the event in EventKey order, so a
//      snapshot from another race at the same timestamp is still the
//      prior. Feature lookups, unlike this, stay strictly before t.
//   3. new = alpha * perf + (1 - alpha) * old  (ExponentialDecay).
//
// Jockeys and trainers follow the same recursion under ShrinkageToMean with
// the population mean of their kind (observed strictly before the event)
// as the target. A trainer saddling two runners in one race contributes a
// single observation: the mean performance of its runners.
//
// Cold start:
//   Fixed          — RatingConfig::default_rating.
//   PopulationMean — RatingStore::populationMeanBefore(kind, stratum, t),
//                    falling back to default_rating when nothing has been
//                    observed. The fallback is explicit, never implicit.
//
// Ordering:
//   update() requires the event to be settled and its key to be strictly
//   after the store's watermark. A violation raises OrderingError naming
//   the event and the watermark. Nothing is appended in that case.
//
// Determinism:
//   No randomness, no unordered iteration in the arithmetic: identical
//   timelines and configuration produce bit-identical histories.
//
// Thread model:
//   The engine itself is immutable and may be shared. A given RatingStore
//   must be driven from a single thread, in timeline order.
// -----------------------------------------------------------------------------
class RatingUpdateEngine {
 public:
  // Throws ConfigError if the configuration is invalid (in particular if
  // no NonFinisherPolicy was chosen).
  explicit RatingUpdateEngine(const domain::RatingConfig& config);

  // -------------------------------------------------------------------------
  // update(store, event)
  // -------------------------------------------------------------------------
  // @brief  Applies one settled event atomically.
  //
  // @param  store  The store to append to.
  // @param  event  A settled event whose key is after store.watermark().
  //
  // @details
  // Throws DegenerateInputError for a pending event, OrderingError for an
  // out-of-order event. Either all snapshots of the event are committed or
  // none are.
  //
  // @return Number of snapshots appended.
  // -------------------------------------------------------------------------
  std::size_t update(RatingStore& store, const domain::Event& event) const;

  // -------------------------------------------------------------------------
  // replay(store, events, cancel)
  // -------------------------------------------------------------------------
  // @brief  The sequential rating pass: applies every settled event in the
  //         given order, skipping pending ones.
  //
  // @param  events  Events in non-decreasing EventKey order.
  // @param  cancel  Optional flag checked between events. When it becomes
  //                 true the pass stops; the store then reflects a prefix
  //                 of `events`.
  // -------------------------------------------------------------------------
  RatingPassStats replay(RatingStore& store,
                         const std::vector<const domain::Event*>& events,
                         const std::atomic<bool>* cancel = nullptr) const;

  RatingPassStats replay(RatingStore& store, const EventTimeline& timeline,
                         const std::atomic<bool>* cancel = nullptr) const;

  // Store key for an entity seen in `event`, honouring
  // RatingConfig::partition_by_stratum.
  domain::EntityKey keyFor(domain::EntityKind kind, domain::EntityId id,
                           const domain::Event& event) const;

  // Rating an entity with no snapshot before t starts from. When the value
  // is a population mean, `population_timestamp_ms` (if given) receives the
  // timestamp of the latest event behind it.
  double coldStartRating(
      const RatingStore& store, domain::EntityKind kind,
      const std::string& stratum, domain::TimestampMs t,
      std::optional<domain::TimestampMs>* population_timestamp_ms =
          nullptr) const;

  const domain::RatingConfig& config() const { return config_; }
  const UpdateStrategy& competitorStrategy() const { return competitor_; }
  const UpdateStrategy& agentStrategy() const { return agent_; }

 private:
  domain::RatingConfig config_;
  UpdateStrategy competitor_;
  UpdateStrategy agent_;
};

}  // namespace turf

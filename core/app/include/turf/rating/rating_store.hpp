#pragma once

#include "turf/domain/entity.hpp"
#include "turf/domain/event.hpp"
#include "turf/domain/rating_snapshot.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// StagedSnapshot — one entity's post-event rating, not yet committed
// -----------------------------------------------------------------------------
// `performance` is the observation that produced the snapshot. The store
// folds it into the per-kind population mean used for cold starts and agent
// shrinkage.
// -----------------------------------------------------------------------------
struct StagedSnapshot {
  domain::EntityKey entity;
  domain::RatingSnapshot snapshot;
  double performance{0.0};
};

// Population mean as of some time: the value, the number of observations
// behind it, and the timestamp of the last event folded into it.
struct PopulationMean {
  double mean{0.0};
  std::size_t observations{0};
  domain::TimestampMs timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RatingStore — append-only arena of rating snapshots
// -----------------------------------------------------------------------------
//
// @brief  Holds the full rating history of every entity and answers
//         point-in-time queries ("what was this horse rated strictly before
//         time T?").
//
// @details
// The store never holds a mutable "current rating". Each event appends one
// immutable RatingSnapshot per involved entity; nothing is overwritten,
// deleted, or reordered. The latest value is simply the last element of a
// history, and any earlier value remains queryable for audit.
//
// Ordering:
//   The store tracks a watermark: the EventKey of the last committed event.
//   commit() requires the new key to be strictly after the watermark and
//   every entity's last snapshot timestamp to be <= the new timestamp.
//   Violations raise OrderingError.
//
// Atomicity:
//   commit() validates every staged snapshot and reserves capacity in every
//   affected history before appending anything. Appending a trivially
//   copyable snapshot into reserved capacity cannot throw, so an event's
//   snapshots are either all visible or none are. A run aborted between
//   events leaves the store consistent with a prefix of the timeline.
//
// Lookups:
//   ratingBefore() is a binary search over one entity's history: O(log h).
//
// Thread model:
//   One writer (the RatingUpdateEngine during the sequential pass), any
//   number of readers. A std::shared_mutex guards the maps; readers take a
//   shared lock, commit() takes a unique lock. Same scheme as the position
//   snapshots in the order-management layer this engine grew out of.
//
// Ownership:
//   Owned by whoever drives the rating pass (the evaluator creates one per
//   fold) and passed by reference. There is no global store.
// -----------------------------------------------------------------------------
class RatingStore {
 public:
  RatingStore() = default;

  RatingStore(const RatingStore&) = delete;
  RatingStore& operator=(const RatingStore&) = delete;
  RatingStore(RatingStore&&) = delete;
  RatingStore& operator=(RatingStore&&) = delete;

  // -------------------------------------------------------------------------
  // commit(event_key, staged)
  // -------------------------------------------------------------------------
  // @brief  Atomically appends one snapshot per entity for a single event.
  //
  // @param  event_key  Key of the event that produced the snapshots.
  // @param  staged     One entry per involved entity. Each snapshot's key
  //                    must equal event_key.
  //
  // @details
  // Throws OrderingError if event_key is not strictly after the watermark,
  // or if any entity already holds a snapshot later than event_key's
  // timestamp. Throws DegenerateInputError if an entity appears twice or a
  // snapshot is stamped with a different event. On any exception the store
  // is unchanged.
  //
  // An empty `staged` still advances the watermark (a race whose entrants
  // produced no ratable entity is still "folded in").
  // -------------------------------------------------------------------------
  void commit(const domain::EventKey& event_key,
              const std::vector<StagedSnapshot>& staged);

  // -------------------------------------------------------------------------
  // ratingBefore(entity, t)
  // -------------------------------------------------------------------------
  // @brief  Point-in-time lookup.
  //
  // @return The snapshot with the largest timestamp strictly less than t,
  //         or std::nullopt if the entity has no such snapshot. Never a
  //         snapshot with timestamp >= t.
  //
  // @details
  // When several snapshots share the largest qualifying timestamp (two
  // events at the same instant), the last appended one is returned.
  // -------------------------------------------------------------------------
  std::optional<domain::RatingSnapshot> ratingBefore(
      const domain::EntityKey& entity, domain::TimestampMs t) const;

  // Most recent snapshot regardless of time, or std::nullopt.
  std::optional<domain::RatingSnapshot> latest(
      const domain::EntityKey& entity) const;

  // Copy of the full history, oldest first.
  std::vector<domain::RatingSnapshot> history(
      const domain::EntityKey& entity) const;

  // -------------------------------------------------------------------------
  // populationMeanBefore(kind, stratum, t)
  // -------------------------------------------------------------------------
  // @brief  Mean of every performance observation of the given kind (and
  //         stratum) committed at a timestamp strictly before t.
  //
  // @return std::nullopt when nothing has been observed before t. The
  //         result carries the timestamp of the latest event it includes,
  //         so callers can record it as provenance.
  //
  // @details
  // Backed by a cumulative (timestamp, sum, count) series per
  // (kind, stratum), so the query is a binary search.
  // -------------------------------------------------------------------------
  std::optional<PopulationMean> populationMeanBefore(
      domain::EntityKind kind, const std::string& stratum,
      domain::TimestampMs t) const;

  // Key of the last committed event, or std::nullopt if nothing committed.
  std::optional<domain::EventKey> watermark() const;

  std::size_t entityCount() const;
  std::size_t snapshotCount() const;

  // Persisted form: every (entity, timestamp, rating) row, ordered by
  // entity then time.
  std::vector<domain::RatingRow> rows() const;

 private:
  struct PopulationPoint {
    domain::TimestampMs timestamp_ms{0};
    double cumulative_sum{0.0};
    std::size_t cumulative_count{0};
  };

  using PopulationKey = std::pair<domain::EntityKind, std::string>;

  mutable std::shared_mutex mutex_;

  std::unordered_map<domain::EntityKey, std::vector<domain::RatingSnapshot>,
                     domain::EntityKeyHash>
      histories_;

  std::map<PopulationKey, std::vector<PopulationPoint>> population_;

  std::optional<domain::EventKey> watermark_;
};

}  // namespace turf

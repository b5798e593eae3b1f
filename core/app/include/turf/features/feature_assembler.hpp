#pragma once

#include "turf/domain/entity.hpp"
#include "turf/domain/event.hpp"
#include "turf/rating/rating_store.hpp"
#include "turf/rating/rating_update_engine.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// Feature layout
// -----------------------------------------------------------------------------
// Column order of every FeatureRow::values vector. Rating-derived columns
// come first; static attributes follow and may be NaN when unknown.
// -----------------------------------------------------------------------------
constexpr Eigen::Index kCompetitorRating = 0;
constexpr Eigen::Index kCompetitorHasHistory = 1;
constexpr Eigen::Index kCompetitorLogRuns = 2;
constexpr Eigen::Index kJockeyRating = 3;
constexpr Eigen::Index kTrainerRating = 4;
constexpr Eigen::Index kAge = 5;
constexpr Eigen::Index kWeightLbs = 6;
constexpr Eigen::Index kDraw = 7;
constexpr std::size_t kFeatureCount = 8;

const std::array<const char*, kFeatureCount>& featureNames();

// Where a rating-derived feature came from. Every rating column records
// one source:
//   snapshot_timestamp_ms   — the entity snapshot consumed, if any.
//   population_timestamp_ms — the latest event behind a population-mean
//                             cold start, if one was used.
// Both are nullopt only for the fixed default rating. `entity.id` is 0 when
// the entrant has no agent of that kind or agents are not rated.
struct FeatureSource {
  domain::EntityKey entity;
  std::optional<domain::TimestampMs> snapshot_timestamp_ms;
  std::optional<domain::EventId> snapshot_event_id;
  std::optional<domain::TimestampMs> population_timestamp_ms;
};

struct FeatureRow {
  domain::EntrantId entrant_id{0};
  Eigen::VectorXd values;
  std::vector<FeatureSource> sources;
};

// -----------------------------------------------------------------------------
// EventFeatures — one race as seen by the model
// -----------------------------------------------------------------------------
// Rows are in entrant order. Outcome fields are filled only for settled
// events and are used exclusively as training labels and for metrics,
// never as inputs.
// -----------------------------------------------------------------------------
struct EventFeatures {
  domain::EventKey key;
  std::vector<FeatureRow> rows;
  std::vector<std::optional<double>> market_prices;
  bool settled{false};
  std::optional<std::size_t> winner;
  std::vector<std::size_t> finishing_order;

  std::size_t size() const { return rows.size(); }
};

// -----------------------------------------------------------------------------
// FeatureAssembler — point-in-time join of entrants with ratings
// -----------------------------------------------------------------------------
//
// @brief  Builds one feature vector per entrant of an upcoming (or
//         historical) event from the RatingStore as of that event's start.
//
// @details
// Every rating-derived feature is obtained by RatingStore::ratingBefore(
// entity, event.timestamp), i.e. the latest snapshot with a timestamp
// strictly less than the event's. An entity with no such snapshot gets the
// cold-start rating defined by the RatingUpdateEngine. Nothing in a row is
// computed from the event's own outcome or from any later event.
//
// Each row records the timestamps of its sources; verifyNoLeak() checks
// them.
//
// Cost: O(entrants * log h) per event.
//
// Thread model: const and stateless beyond references; concurrent calls
// against a store that is not being written are safe.
// -----------------------------------------------------------------------------
class FeatureAssembler {
 public:
  FeatureAssembler(const RatingStore& store, const RatingUpdateEngine& engine);

  EventFeatures assemble(const domain::Event& event) const;

  // -------------------------------------------------------------------------
  // verifyNoLeak(features, boundary)
  // -------------------------------------------------------------------------
  // @brief  Explicit leakage assertion.
  //
  // @details
  // Throws LeakageError if any source (entity snapshot or population mean)
  // has a timestamp >= the event's timestamp, or >= `boundary_ms` when a
  // boundary is given (the evaluator passes the start of the test window).
  // The message names the event, the entity, and both timestamps.
  // -------------------------------------------------------------------------
  static void verifyNoLeak(
      const EventFeatures& features,
      std::optional<domain::TimestampMs> boundary_ms = std::nullopt);

 private:
  // Rating value and its source for one entity as of time t.
  double ratingAsOf(const domain::EntityKey& entity, domain::TimestampMs t,
                    FeatureSource& source,
                    std::uint32_t* observations) const;

  const RatingStore& store_;
  const RatingUpdateEngine& engine_;
};

}  // namespace turf

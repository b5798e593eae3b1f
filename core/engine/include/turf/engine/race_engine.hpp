#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/rating_snapshot.hpp"
#include "turf/evaluation/forward_chaining_evaluator.hpp"
#include "turf/eventbus/event_bus.hpp"
#include "turf/model/i_race_model.hpp"
#include "turf/rating/rating_update_engine.hpp"
#include "turf/timeline/event_timeline.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <vector>

namespace turf {

// Output of RaceEngine::forecast(): one Prediction per pending event, in
// timeline order.
struct Forecast {
  std::size_t training_events{0};
  FitSummary fit;
  std::optional<domain::EventKey> rating_watermark;
  std::vector<Prediction> predictions;
  std::size_t numerical_incidents{0};
  bool cancelled{false};
};

// -----------------------------------------------------------------------------
// RaceEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the engine: owns the configuration, the
//         EventBus and the evaluator, and exposes the two run modes.
//
// @details
// backtest(timeline)
//   Forward-chaining evaluation over the settled events (see
//   ForwardChainingEvaluator). Returns the full EvaluationReport.
//
// forecast(timeline)
//   Replays every settled event into a fresh RatingStore, fits the model on
//   all settled events, and predicts every pending event point-in-time.
//
// ratingHistory(timeline)
//   The sequential rating pass on its own, exported as rows for audit.
//
// Nothing persists between calls: every run starts from an empty store, so
// repeated calls on the same timeline give identical results.
//
// Thread model:
//   Run methods are called from one thread. cancel() and eventBus()
//   subscriptions are safe from any thread; bus callbacks may fire on
//   evaluator worker threads.
//
// Ownership:
//   RaceEngine
//    ├── config_     (EngineConfig, validated in the constructor)
//    ├── bus_        (EventBus, outlives evaluator_)
//    ├── ratings_    (RatingUpdateEngine, immutable)
//    └── evaluator_  (ForwardChainingEvaluator, holds &bus_)
// -----------------------------------------------------------------------------
class RaceEngine {
 public:
  // Throws ConfigError if the configuration is invalid.
  explicit RaceEngine(const domain::EngineConfig& config);

  RaceEngine(const RaceEngine&) = delete;
  RaceEngine& operator=(const RaceEngine&) = delete;
  RaceEngine(RaceEngine&&) = delete;
  RaceEngine& operator=(RaceEngine&&) = delete;

  EvaluationReport backtest(const EventTimeline& timeline);
  EvaluationReport backtest(const EventTimeline& timeline,
                            const std::vector<Fold>& folds);

  Forecast forecast(const EventTimeline& timeline);

  std::vector<domain::RatingRow> ratingHistory(const EventTimeline& timeline);

  // Stops the run in progress at the next event or fold boundary.
  void cancel();

  EventBus& eventBus() { return bus_; }
  const domain::EngineConfig& config() const { return config_; }

 private:
  domain::EngineConfig config_;
  EventBus bus_;
  RatingUpdateEngine ratings_;
  ForwardChainingEvaluator evaluator_;
  std::atomic<bool> cancel_{false};
};

}  // namespace turf

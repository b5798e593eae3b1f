#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/event.hpp"
#include "turf/evaluation/fold_plan.hpp"
#include "turf/evaluation/metrics.hpp"
#include "turf/eventbus/event_bus.hpp"
#include "turf/model/i_race_model.hpp"
#include "turf/rating/rating_update_engine.hpp"
#include "turf/timeline/event_timeline.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace turf {

// One row of the prediction table: a single entrant of a scored event.
struct PredictionRow {
  std::size_t fold_index{0};
  domain::EventId event_id{0};
  domain::TimestampMs timestamp_ms{0};
  domain::EntrantId entrant_id{0};
  double probability{0.0};
  double score{0.0};
  std::optional<double> market_price;  // Passed through, never a feature
  bool won{false};
  bool numerical_fallback{false};
};

struct FoldResult {
  std::size_t index{0};
  FoldState state{FoldState::Idle};
  std::string skip_reason;
  std::size_t train_events{0};
  std::size_t test_events{0};
  std::optional<domain::TimestampMs> train_end_ms;  // Latest train timestamp
  domain::TimestampMs test_start_ms{0};
  domain::TimestampMs test_end_ms{0};
  RatingPassStats rating_pass;
  FitSummary fit;
  MetricsSummary metrics;
  std::size_t numerical_incidents{0};
};

struct EvaluationReport {
  domain::ModelVariant variant{domain::ModelVariant::Softmax};
  std::uint64_t seed{0};
  std::size_t folds_planned{0};
  std::vector<FoldResult> folds;          // Completed and skipped, in order
  std::vector<std::size_t> skipped_folds;
  MetricsSummary aggregate;               // Over completed folds only
  std::size_t numerical_incidents{0};
  std::vector<PredictionRow> predictions;
  bool cancelled{false};
};

// -----------------------------------------------------------------------------
// ForwardChainingEvaluator — leakage-safe walk-forward backtest
// -----------------------------------------------------------------------------
//
// @brief  Trains on each fold's past, scores its future, and reports
//         log-loss, Brier and calibration over all folds.
//
// @details
// Every fold is validated before any work starts: a train event that is not
// strictly earlier than the fold's test window raises LeakageError and the
// run produces no report at all.
//
// Per fold (see FoldState):
//
//   Training    A fresh RatingStore is replayed from the fold's train
//               events only. Training features are assembled point-in-time
//               from that store, leak-checked against each event and the
//               fold boundary, and the model is fitted.
//   Scoring     Each test event is assembled against the same store, so
//               ratings are frozen at the boundary and no test outcome can
//               reach a test prediction. Features are leak-checked again.
//   Aggregating Log-loss, Brier and calibration sums for the fold.
//
// A fold with an empty train window is Skipped: a warning is logged, a
// FoldSkippedEvent is published, and the report lists it.
//
// Predictions that fall back to the uniform distribution are counted as
// numerical incidents (per fold and in total) and published as
// NumericalIncidentEvent; they do not abort the run.
//
// Concurrency:
//   With worker_threads > 1 folds are handed to a worker pool through a
//   ThreadSafeQueue. Folds share nothing mutable, and results are merged in
//   fold order, so the report is identical to a single-threaded run. The
//   first fatal error stops the remaining folds and is rethrown from
//   evaluate().
//
// Cancellation:
//   cancel() may be called from any thread (including a bus callback)
//   while evaluate() runs. Folds that had not completed are left out of
//   the report and `cancelled` is set.
// -----------------------------------------------------------------------------
class ForwardChainingEvaluator {
 public:
  // Throws ConfigError if the configuration is invalid. `bus` may be null.
  explicit ForwardChainingEvaluator(const domain::EngineConfig& config,
                                    EventBus* bus = nullptr);

  ForwardChainingEvaluator(const ForwardChainingEvaluator&) = delete;
  ForwardChainingEvaluator& operator=(const ForwardChainingEvaluator&) = delete;

  // Plans folds with planFolds() and evaluates them.
  EvaluationReport evaluate(const EventTimeline& timeline);

  // Evaluates explicitly supplied folds.
  EvaluationReport evaluate(const EventTimeline& timeline,
                            const std::vector<Fold>& folds);

  void cancel();
  bool cancelRequested() const { return cancel_requested_.load(); }

  const domain::EngineConfig& config() const { return config_; }

 private:
  struct FoldOutcome;

  std::optional<FoldOutcome> runFold(const EventTimeline& timeline,
                                     const Fold& fold);
  void transition(FoldResult& result, FoldState to);
  void publish(const EngineEvent& event);

  domain::EngineConfig config_;
  RatingUpdateEngine ratings_;
  EventBus* bus_;

  std::atomic<bool> cancel_requested_{false};
  std::atomic<bool> stop_{false};
};

}  // namespace turf

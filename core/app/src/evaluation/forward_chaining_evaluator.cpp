#include "turf/evaluation/forward_chaining_evaluator.hpp"
#include "turf/concurrent/thread_safe_queue.hpp"
#include "turf/errors.hpp"
#include "turf/features/feature_assembler.hpp"
#include "turf/model/race_model_factory.hpp"
#include "turf/rating/rating_store.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>

namespace turf {

struct ForwardChainingEvaluator::FoldOutcome {
  FoldResult result;
  MetricsAccumulator metrics;
  std::vector<PredictionRow> rows;
};

ForwardChainingEvaluator::ForwardChainingEvaluator(
    const domain::EngineConfig& config, EventBus* bus)
    : config_(config), ratings_(config.rating), bus_(bus) {
  config_.validate();
}

void ForwardChainingEvaluator::cancel() {
  cancel_requested_.store(true);
  stop_.store(true);
}

void ForwardChainingEvaluator::publish(const EngineEvent& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

void ForwardChainingEvaluator::transition(FoldResult& result, FoldState to) {
  FoldStateEvent event;
  event.fold_index = result.index;
  event.from = result.state;
  event.to = to;
  event.wall_time = std::chrono::system_clock::now();
  result.state = to;
  publish(event);
}

EvaluationReport ForwardChainingEvaluator::evaluate(
    const EventTimeline& timeline) {
  return evaluate(timeline, planFolds(timeline, config_.evaluation));
}

// -----------------------------------------------------------------------------
// runFold: Idle -> Training -> Scoring -> Aggregating -> Complete
// -----------------------------------------------------------------------------
std::optional<ForwardChainingEvaluator::FoldOutcome>
ForwardChainingEvaluator::runFold(const EventTimeline& timeline,
                                  const Fold& fold) {
  FoldOutcome out{FoldResult{}, MetricsAccumulator(config_.evaluation.calibration_bins),
                  {}};
  FoldResult& result = out.result;
  result.index = fold.index;
  result.train_events = fold.train.size();
  result.test_events = fold.test.size();
  result.test_start_ms = foldBoundary(timeline, fold);
  result.test_end_ms = result.test_start_ms;
  for (std::size_t i : fold.test) {
    result.test_end_ms = std::max(result.test_end_ms, timeline.at(i).timestamp_ms);
  }
  const domain::TimestampMs boundary = result.test_start_ms;

  std::vector<const domain::Event*> train;
  train.reserve(fold.train.size());
  for (std::size_t i : fold.train) {
    const domain::Event& e = timeline.at(i);
    train.push_back(&e);
    if (!result.train_end_ms || *result.train_end_ms < e.timestamp_ms) {
      result.train_end_ms = e.timestamp_ms;
    }
  }

  if (train.empty()) {
    result.skip_reason = "empty training window";
    transition(result, FoldState::Skipped);
    std::ostringstream os;
    os << "[Evaluator] WARNING: fold " << fold.index
       << " skipped (empty training window, test starts t=" << boundary
       << "ms)\n";
    std::cerr << os.str();

    FoldSkippedEvent skipped;
    skipped.fold_index = fold.index;
    skipped.reason = result.skip_reason;
    skipped.test_start_ms = boundary;
    skipped.wall_time = std::chrono::system_clock::now();
    publish(skipped);
    return out;
  }

  // --- Training -------------------------------------------------------------
  transition(result, FoldState::Training);
  RatingStore store;
  result.rating_pass = ratings_.replay(store, train, &stop_);

  RatingPassEvent pass;
  pass.fold_index = fold.index;
  pass.events_applied = result.rating_pass.events_applied;
  pass.pending_skipped = result.rating_pass.pending_skipped;
  pass.snapshots_appended = result.rating_pass.snapshots_appended;
  pass.cancelled = result.rating_pass.cancelled;
  pass.wall_time = std::chrono::system_clock::now();
  publish(pass);

  if (result.rating_pass.cancelled) {
    return std::nullopt;
  }

  const FeatureAssembler assembler(store, ratings_);
  std::vector<EventFeatures> training;
  training.reserve(train.size());
  for (const domain::Event* e : train) {
    if (!e->isSettled()) {
      continue;
    }
    EventFeatures features = assembler.assemble(*e);
    FeatureAssembler::verifyNoLeak(features, boundary);
    training.push_back(std::move(features));
  }

  std::unique_ptr<IRaceModel> model = makeRaceModel(config_.model);
  result.fit = model->fit(training);
  if (stop_.load()) {
    return std::nullopt;
  }

  // --- Scoring --------------------------------------------------------------
  transition(result, FoldState::Scoring);
  std::vector<std::pair<Prediction, std::optional<std::size_t>>> scored;
  scored.reserve(fold.test.size());
  for (std::size_t i : fold.test) {
    const domain::Event& e = timeline.at(i);
    EventFeatures features = assembler.assemble(e);
    FeatureAssembler::verifyNoLeak(features, boundary);

    Prediction prediction = model->predict(features);
    if (prediction.numerical_fallback) {
      ++result.numerical_incidents;
      NumericalIncidentEvent incident;
      incident.fold_index = fold.index;
      incident.event_id = e.event_id;
      incident.reason = prediction.fallback_reason;
      incident.wall_time = std::chrono::system_clock::now();
      publish(incident);
    }

    for (std::size_t k = 0; k < prediction.entrant_ids.size(); ++k) {
      const auto r = static_cast<Eigen::Index>(k);
      PredictionRow row;
      row.fold_index = fold.index;
      row.event_id = e.event_id;
      row.timestamp_ms = e.timestamp_ms;
      row.entrant_id = prediction.entrant_ids[k];
      row.probability = prediction.probabilities[r];
      row.score = prediction.scores[r];
      row.market_price = features.market_prices[k];
      row.won = features.winner && *features.winner == k;
      row.numerical_fallback = prediction.numerical_fallback;
      out.rows.push_back(row);
    }
    scored.emplace_back(std::move(prediction), features.winner);
  }
  if (stop_.load()) {
    return std::nullopt;
  }

  // --- Aggregating ----------------------------------------------------------
  transition(result, FoldState::Aggregating);
  for (const auto& [prediction, winner] : scored) {
    out.metrics.add(prediction, winner);
  }
  result.metrics = out.metrics.summary();

  transition(result, FoldState::Complete);
  std::ostringstream os;
  os << "[Evaluator] fold " << fold.index << " complete: train="
     << result.train_events << " test=" << result.test_events
     << " log_loss=" << result.metrics.log_loss
     << " brier=" << result.metrics.brier
     << " incidents=" << result.numerical_incidents << "\n";
  std::cout << os.str();
  return out;
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
EvaluationReport ForwardChainingEvaluator::evaluate(
    const EventTimeline& timeline, const std::vector<Fold>& folds) {
  cancel_requested_.store(false);
  stop_.store(false);

  for (const auto& fold : folds) {
    validateFold(timeline, fold);
  }

  std::vector<std::optional<FoldOutcome>> outcomes(folds.size());
  std::vector<std::exception_ptr> errors(folds.size());

  const std::size_t workers =
      std::min(config_.evaluation.worker_threads, folds.size());
  if (workers <= 1) {
    for (std::size_t i = 0; i < folds.size() && !stop_.load(); ++i) {
      outcomes[i] = runFold(timeline, folds[i]);
    }
  } else {
    ThreadSafeQueue<std::size_t> work;
    for (std::size_t i = 0; i < folds.size(); ++i) {
      work.push(i);
    }
    work.close();

    auto worker = [&]() {
      while (auto i = work.pop()) {
        if (stop_.load()) {
          continue;
        }
        try {
          outcomes[*i] = runFold(timeline, folds[*i]);
        } catch (...) {
          errors[*i] = std::current_exception();
          stop_.store(true);
        }
      }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      pool.emplace_back(worker);
    }
    for (auto& t : pool) {
      t.join();
    }

    for (const auto& error : errors) {
      if (error) {
        std::rethrow_exception(error);
      }
    }
  }

  EvaluationReport report;
  report.variant = config_.model.variant;
  report.seed = config_.model.seed;
  report.folds_planned = folds.size();
  report.cancelled = cancel_requested_.load();

  MetricsAccumulator aggregate(config_.evaluation.calibration_bins);
  for (auto& outcome : outcomes) {
    if (!outcome) {
      continue;
    }
    FoldResult& result = outcome->result;
    if (result.state == FoldState::Skipped) {
      report.skipped_folds.push_back(result.index);
    } else {
      aggregate.merge(outcome->metrics);
      report.numerical_incidents += result.numerical_incidents;
      report.predictions.insert(report.predictions.end(),
                                outcome->rows.begin(), outcome->rows.end());
    }
    report.folds.push_back(std::move(result));
  }
  report.aggregate = aggregate.summary();

  std::ostringstream os;
  os << "[Evaluator] " << report.folds.size() << "/" << report.folds_planned
     << " folds evaluated, " << report.skipped_folds.size() << " skipped, "
     << report.numerical_incidents << " numerical incidents"
     << (report.cancelled ? " (cancelled)" : "") << "\n";
  std::cout << os.str();
  return report;
}

}  // namespace turf

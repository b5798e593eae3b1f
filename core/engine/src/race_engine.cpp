#include "turf/engine/race_engine.hpp"
#include "turf/features/feature_assembler.hpp"
#include "turf/model/race_model_factory.hpp"
#include "turf/rating/rating_store.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <utility>

namespace turf {

namespace {

const char* variantName(domain::ModelVariant v) {
  return v == domain::ModelVariant::Softmax ? "softmax" : "plackett-luce";
}

}  // namespace

RaceEngine::RaceEngine(const domain::EngineConfig& config)
    : config_(config), ratings_(config.rating), evaluator_(config, &bus_) {
  config_.validate();
}

void RaceEngine::cancel() {
  cancel_.store(true);
  evaluator_.cancel();
}

// -----------------------------------------------------------------------------
// backtest
// -----------------------------------------------------------------------------
EvaluationReport RaceEngine::backtest(const EventTimeline& timeline) {
  std::cout << "[RaceEngine] backtest: " << timeline.size() << " events, "
            << variantName(config_.model.variant) << " model, "
            << config_.evaluation.worker_threads << " worker(s)\n";
  return evaluator_.evaluate(timeline);
}

EvaluationReport RaceEngine::backtest(const EventTimeline& timeline,
                                      const std::vector<Fold>& folds) {
  std::cout << "[RaceEngine] backtest: " << folds.size()
            << " explicit fold(s)\n";
  return evaluator_.evaluate(timeline, folds);
}

// -----------------------------------------------------------------------------
// forecast
// -----------------------------------------------------------------------------
Forecast RaceEngine::forecast(const EventTimeline& timeline) {
  cancel_.store(false);
  Forecast out;

  RatingStore store;
  const RatingPassStats stats = ratings_.replay(store, timeline, &cancel_);

  RatingPassEvent pass;
  pass.events_applied = stats.events_applied;
  pass.pending_skipped = stats.pending_skipped;
  pass.snapshots_appended = stats.snapshots_appended;
  pass.cancelled = stats.cancelled;
  pass.wall_time = std::chrono::system_clock::now();
  bus_.publish(pass);

  out.rating_watermark = store.watermark();
  if (stats.cancelled) {
    out.cancelled = true;
    std::cerr << "[RaceEngine] forecast cancelled during the rating pass\n";
    return out;
  }

  const FeatureAssembler assembler(store, ratings_);
  std::vector<EventFeatures> training;
  for (const domain::Event* e : timeline.settledEvents()) {
    EventFeatures features = assembler.assemble(*e);
    FeatureAssembler::verifyNoLeak(features);
    training.push_back(std::move(features));
  }
  out.training_events = training.size();

  std::unique_ptr<IRaceModel> model = makeRaceModel(config_.model);
  out.fit = model->fit(training);

  for (const domain::Event* e : timeline.pendingEvents()) {
    if (cancel_.load()) {
      out.cancelled = true;
      break;
    }
    const EventFeatures features = assembler.assemble(*e);
    FeatureAssembler::verifyNoLeak(features);
    Prediction prediction = model->predict(features);
    if (prediction.numerical_fallback) {
      ++out.numerical_incidents;
      NumericalIncidentEvent incident;
      incident.event_id = e->event_id;
      incident.reason = prediction.fallback_reason;
      incident.wall_time = std::chrono::system_clock::now();
      bus_.publish(incident);
    }
    out.predictions.push_back(std::move(prediction));
  }

  std::cout << "[RaceEngine] forecast: trained on " << out.training_events
            << " settled event(s), predicted " << out.predictions.size()
            << " pending event(s)\n";
  return out;
}

std::vector<domain::RatingRow> RaceEngine::ratingHistory(
    const EventTimeline& timeline) {
  cancel_.store(false);
  RatingStore store;
  const RatingPassStats stats = ratings_.replay(store, timeline, &cancel_);

  RatingPassEvent pass;
  pass.events_applied = stats.events_applied;
  pass.pending_skipped = stats.pending_skipped;
  pass.snapshots_appended = stats.snapshots_appended;
  pass.cancelled = stats.cancelled;
  pass.wall_time = std::chrono::system_clock::now();
  bus_.publish(pass);

  return store.rows();
}

}  // namespace turf

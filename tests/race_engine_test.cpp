// =============================================================================
// race_engine_test.cpp
// =============================================================================
// End-to-end tests for turf::RaceEngine: backtest, forecast of pending races,
// and the exported rating history.
//
// Validates:
//   - The constructor rejects an invalid configuration
//   - backtest() is repeatable: nothing persists between runs
//   - forecast() trains on settled races and predicts only pending ones
//   - Forecast probabilities follow the latent ability of the season
//   - ratingHistory() announces its pass on the engine's EventBus
// =============================================================================

#include "turf/engine/race_engine.hpp"
#include "turf/errors.hpp"

#include "race_fixtures.hpp"

#include <gtest/gtest.h>

#include <map>
#include <vector>

using turf::EventTimeline;
using turf::RaceEngine;

namespace {

double probabilityOf(const turf::Prediction& p, turf::domain::EntrantId id) {
  for (std::size_t k = 0; k < p.entrant_ids.size(); ++k) {
    if (p.entrant_ids[k] == id) {
      return p.probabilities[static_cast<Eigen::Index>(k)];
    }
  }
  ADD_FAILURE() << "entrant " << id << " not in prediction";
  return 0.0;
}

}  // namespace

// =============================================================================
// Test fixture: a 60-race settled season, days 1..60.
// =============================================================================
class RaceEngineTest : public ::testing::Test {
 protected:
  turf::domain::EngineConfig config = turf_test::engineConfig();
  std::vector<turf::domain::Event> season = turf_test::syntheticSeason(60);
};

// -----------------------------------------------------------------------------
// 1. A configuration without a non-finisher policy never builds an engine.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, RejectsInvalidConfig) {
  config.rating.non_finisher_policy.reset();
  EXPECT_THROW(RaceEngine engine(config), turf::ConfigError);

  config = turf_test::engineConfig();
  config.evaluation.calibration_bins = 0;
  EXPECT_THROW(RaceEngine engine(config), turf::ConfigError);
}

// -----------------------------------------------------------------------------
// 2. Two backtests of the same timeline give the same report.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, BacktestIsRepeatable) {
  RaceEngine engine(config);
  const EventTimeline timeline(season);

  const auto first = engine.backtest(timeline);
  const auto second = engine.backtest(timeline);

  ASSERT_EQ(first.folds.size(), 1u);
  EXPECT_EQ(first.aggregate.events, 20u);
  ASSERT_EQ(first.predictions.size(), second.predictions.size());
  for (std::size_t i = 0; i < first.predictions.size(); ++i) {
    EXPECT_DOUBLE_EQ(first.predictions[i].probability,
                     second.predictions[i].probability);
  }
  EXPECT_DOUBLE_EQ(first.aggregate.log_loss, second.aggregate.log_loss);
}

// -----------------------------------------------------------------------------
// 3. Explicit folds go through the same evaluator.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, BacktestWithExplicitFolds) {
  RaceEngine engine(config);
  const EventTimeline timeline(season);

  turf::Fold fold;
  fold.index = 0;
  for (std::size_t i = 0; i < 30; ++i) fold.train.push_back(i);
  for (std::size_t i = 30; i < 40; ++i) fold.test.push_back(i);

  const auto report = engine.backtest(timeline, {fold});
  ASSERT_EQ(report.folds.size(), 1u);
  EXPECT_EQ(report.folds[0].state, turf::FoldState::Complete);
  EXPECT_EQ(report.folds[0].train_events, 30u);
  EXPECT_EQ(report.predictions.size(), 60u);

  turf::Fold leaky = fold;
  leaky.train.push_back(35);
  EXPECT_THROW(engine.backtest(timeline, {leaky}), turf::LeakageError);
}

// -----------------------------------------------------------------------------
// 4. forecast() predicts pending races only, after training on every
//    settled race.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, ForecastPredictsPendingRaces) {
  auto events = season;
  events.push_back(turf_test::pendingRace(5000, 61 * turf_test::kDayMs,
                                          {1, 2, 3, 22, 23, 24}));
  events.push_back(turf_test::pendingRace(5001, 62 * turf_test::kDayMs,
                                          {5, 9, 13, 17}));
  const EventTimeline timeline(events);

  RaceEngine engine(config);
  const turf::Forecast forecast = engine.forecast(timeline);

  EXPECT_FALSE(forecast.cancelled);
  EXPECT_EQ(forecast.training_events, 60u);
  EXPECT_GT(forecast.fit.events_used, 0u);
  ASSERT_TRUE(forecast.rating_watermark.has_value());
  EXPECT_EQ(forecast.rating_watermark->event_id, 1059u);
  EXPECT_EQ(forecast.rating_watermark->timestamp_ms, 60 * turf_test::kDayMs);

  ASSERT_EQ(forecast.predictions.size(), 2u);
  EXPECT_EQ(forecast.predictions[0].key.event_id, 5000u);
  EXPECT_EQ(forecast.predictions[1].key.event_id, 5001u);
  for (const auto& p : forecast.predictions) {
    EXPECT_NEAR(p.probabilities.sum(), 1.0, 1e-9);
    EXPECT_FALSE(p.numerical_fallback);
    EXPECT_EQ(p.entrant_ids.size(), static_cast<std::size_t>(p.probabilities.size()));
  }
}

// -----------------------------------------------------------------------------
// 5. In the synthetic season ability rises with the competitor id, so the
//    strongest runner should be favoured over the weakest.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, ForecastFavoursStrongerCompetitors) {
  auto events = turf_test::syntheticSeason(150);
  events.push_back(turf_test::pendingRace(5000, 151 * turf_test::kDayMs,
                                          {1, 2, 3, 22, 23, 24}));
  const EventTimeline timeline(events);

  RaceEngine engine(config);
  const turf::Forecast forecast = engine.forecast(timeline);

  ASSERT_EQ(forecast.predictions.size(), 1u);
  const auto& p = forecast.predictions[0];
  EXPECT_GT(probabilityOf(p, 24), probabilityOf(p, 1));
  EXPECT_GT(probabilityOf(p, 23), probabilityOf(p, 2));
}

// -----------------------------------------------------------------------------
// 6. A timeline with nothing pending forecasts nothing.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, ForecastWithoutPendingRaces) {
  RaceEngine engine(config);
  const turf::Forecast forecast = engine.forecast(EventTimeline(season));
  EXPECT_EQ(forecast.training_events, 60u);
  EXPECT_TRUE(forecast.predictions.empty());
}

// -----------------------------------------------------------------------------
// 7. ratingHistory() returns the audit table and publishes its pass.
// -----------------------------------------------------------------------------
TEST_F(RaceEngineTest, RatingHistoryPublishesPass) {
  RaceEngine engine(config);
  std::vector<turf::RatingPassEvent> passes;
  engine.eventBus().subscribe<turf::RatingPassEvent>(
      [&passes](const turf::RatingPassEvent& e) { passes.push_back(e); });

  const auto rows = engine.ratingHistory(EventTimeline(season));

  ASSERT_EQ(passes.size(), 1u);
  EXPECT_EQ(passes[0].events_applied, 60u);
  EXPECT_FALSE(passes[0].cancelled);
  EXPECT_EQ(rows.size(), passes[0].snapshots_appended);
  ASSERT_FALSE(rows.empty());

  // Each entity's history is in time order.
  std::map<turf::domain::EntityKey, turf::domain::TimestampMs> last_seen;
  for (const auto& row : rows) {
    auto it = last_seen.find(row.entity);
    if (it != last_seen.end()) {
      EXPECT_LT(it->second, row.timestamp_ms) << turf::domain::describe(row.entity);
    }
    last_seen[row.entity] = row.timestamp_ms;
    EXPECT_GE(row.rating, 0.0);
    EXPECT_LE(row.rating, 1.0);
  }
}

// =============================================================================
// race_model_test.cpp
// =============================================================================
// Unit tests for the probability layer: normalizeScores, the softmax win
// model, the Plackett-Luce model and the model factory.
//
// Validates:
//   - A single entrant gets probability exactly 1
//   - Ordered scores give strictly ordered probabilities summing to 1
//   - Non-finite scores fall back to uniform and are flagged
//   - Fitting recovers a positive weight on an informative feature
//   - Likelihoods at zero weights match the combinatorial values
// =============================================================================

#include "turf/errors.hpp"
#include "turf/features/feature_assembler.hpp"
#include "turf/model/plackett_luce_model.hpp"
#include "turf/model/race_model_factory.hpp"
#include "turf/model/softmax.hpp"
#include "turf/model/softmax_win_model.hpp"
#include "turf/rating/rating_update_engine.hpp"
#include "turf/timeline/event_timeline.hpp"

#include "race_fixtures.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

using turf::EventFeatures;
using turf::PlackettLuceModel;
using turf::SoftmaxWinModel;
using turf::domain::ModelConfig;
using turf::domain::ModelVariant;

namespace {

// An event whose only informative column is the competitor rating.
EventFeatures handEvent(turf::domain::EventId id,
                        const std::vector<double>& ratings,
                        std::optional<std::size_t> winner,
                        std::vector<std::size_t> order = {}) {
  EventFeatures f;
  f.key = turf::domain::EventKey{static_cast<turf::domain::TimestampMs>(id), id};
  for (std::size_t i = 0; i < ratings.size(); ++i) {
    turf::FeatureRow row;
    row.entrant_id = i + 1;
    row.values =
        Eigen::VectorXd::Zero(static_cast<Eigen::Index>(turf::kFeatureCount));
    row.values[turf::kCompetitorRating] = ratings[i];
    f.rows.push_back(row);
  }
  f.settled = true;
  f.winner = winner;
  if (order.empty() && winner) {
    order.push_back(*winner);
  }
  f.finishing_order = std::move(order);
  return f;
}

ModelConfig modelConfig(ModelVariant variant) {
  ModelConfig c;
  c.variant = variant;
  c.l2_penalty = 1e-2;
  c.max_iterations = 300;
  return c;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. A one-runner event is certain.
// -----------------------------------------------------------------------------
TEST(NormalizeScoresTest, SingleEntrantHasProbabilityOne) {
  Eigen::VectorXd scores(1);
  scores << -3.7;
  const auto n = turf::normalizeScores(scores, 1e-9);
  ASSERT_EQ(n.probabilities.size(), 1);
  EXPECT_EQ(n.probabilities[0], 1.0);
  EXPECT_FALSE(n.fallback);
}

// -----------------------------------------------------------------------------
// 2. Scores [2, 1, 0, -1] give strictly decreasing probabilities.
// -----------------------------------------------------------------------------
TEST(NormalizeScoresTest, OrderedScoresGiveOrderedProbabilities) {
  Eigen::VectorXd scores(4);
  scores << 2.0, 1.0, 0.0, -1.0;
  const auto n = turf::normalizeScores(scores, 1e-9);

  EXPECT_FALSE(n.fallback);
  EXPECT_NEAR(n.probabilities.sum(), 1.0, 1e-12);
  for (Eigen::Index i = 0; i + 1 < 4; ++i) {
    EXPECT_GT(n.probabilities[i], n.probabilities[i + 1]);
    EXPECT_NEAR(n.probabilities[i] / n.probabilities[i + 1], std::exp(1.0),
                1e-9);
  }
}

// -----------------------------------------------------------------------------
// 3. Very large scores do not overflow.
// -----------------------------------------------------------------------------
TEST(NormalizeScoresTest, LargeScoresAreStable) {
  Eigen::VectorXd scores(3);
  scores << 1000.0, 1000.0, 0.0;
  const auto n = turf::normalizeScores(scores, 1e-9);
  EXPECT_FALSE(n.fallback);
  EXPECT_NEAR(n.probabilities[0], 0.5, 1e-12);
  EXPECT_NEAR(n.probabilities[1], 0.5, 1e-12);
  EXPECT_GE(n.probabilities[2], 0.0);

  EXPECT_NEAR(turf::logSumExp(scores), 1000.0 + std::log(2.0), 1e-9);
}

// -----------------------------------------------------------------------------
// 4. NaN or infinite scores fall back to uniform with a reason.
// -----------------------------------------------------------------------------
TEST(NormalizeScoresTest, NonFiniteScoresFallBackToUniform) {
  Eigen::VectorXd scores(4);
  scores << 0.5, std::numeric_limits<double>::quiet_NaN(), 0.1,
      std::numeric_limits<double>::infinity();
  const auto n = turf::normalizeScores(scores, 1e-9);
  EXPECT_TRUE(n.fallback);
  EXPECT_FALSE(n.reason.empty());
  for (Eigen::Index i = 0; i < 4; ++i) {
    EXPECT_DOUBLE_EQ(n.probabilities[i], 0.25);
  }
}

// -----------------------------------------------------------------------------
// 5. Zero entrants cannot be normalised or scored.
// -----------------------------------------------------------------------------
TEST(NormalizeScoresTest, ZeroEntrantsIsDegenerate) {
  EXPECT_THROW(turf::normalizeScores(Eigen::VectorXd(0), 1e-9),
               turf::DegenerateInputError);
  EXPECT_THROW(turf::logSumExp(Eigen::VectorXd(0)), turf::DegenerateInputError);

  const SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  EventFeatures empty;
  EXPECT_THROW(model.score(empty), turf::DegenerateInputError);
}

// -----------------------------------------------------------------------------
// 6. The winner always has the higher rating: the fitted weight is positive.
// -----------------------------------------------------------------------------
TEST(SoftmaxWinModelTest, LearnsPositiveWeightOnInformativeFeature) {
  std::vector<EventFeatures> training;
  for (turf::domain::EventId id = 1; id <= 30; ++id) {
    if (id % 2 == 0) {
      training.push_back(handEvent(id, {0.7, 0.3}, 0));
    } else {
      training.push_back(handEvent(id, {0.3, 0.7}, 1));
    }
  }

  SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  const turf::FitSummary summary = model.fit(training);

  EXPECT_TRUE(model.isFitted());
  EXPECT_EQ(summary.events_used, 30u);
  EXPECT_GT(summary.iterations, 0u);
  EXPECT_LT(summary.final_loss, std::log(2.0));
  EXPECT_GT(model.weights()[turf::kCompetitorRating], 0.0);
  EXPECT_DOUBLE_EQ(model.weights()[turf::kAge], 0.0);

  const turf::Prediction p = model.predict(handEvent(99, {0.7, 0.3}, 0));
  EXPECT_GT(p.probabilities[0], p.probabilities[1]);
  EXPECT_NEAR(p.probabilities.sum(), 1.0, 1e-12);
  EXPECT_EQ(p.entrant_ids, (std::vector<turf::domain::EntrantId>{1, 2}));
}

// -----------------------------------------------------------------------------
// 7. Events without a winner or with one runner are left out of training.
// -----------------------------------------------------------------------------
TEST(SoftmaxWinModelTest, ExcludesUnusableEventsAndStaysUniform) {
  std::vector<EventFeatures> training;
  training.push_back(handEvent(1, {0.7, 0.3}, std::nullopt));
  training.push_back(handEvent(2, {0.9}, 0));

  SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  const auto summary = model.fit(training);
  EXPECT_EQ(summary.events_used, 0u);
  EXPECT_EQ(summary.events_excluded, 2u);
  EXPECT_TRUE(model.weights().isZero());

  const auto p = model.predict(handEvent(3, {0.1, 0.5, 0.9}, std::nullopt));
  for (Eigen::Index i = 0; i < 3; ++i) {
    EXPECT_NEAR(p.probabilities[i], 1.0 / 3.0, 1e-12);
  }
}

// -----------------------------------------------------------------------------
// 8. Training on an unsettled event is an input error.
// -----------------------------------------------------------------------------
TEST(SoftmaxWinModelTest, RejectsUnsettledTrainingEvent) {
  auto e = handEvent(1, {0.7, 0.3}, 0);
  e.settled = false;
  SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  EXPECT_THROW(model.fit({e}), turf::DegenerateInputError);
  EXPECT_THROW(model.eventLogLikelihood(e), turf::DegenerateInputError);
}

// -----------------------------------------------------------------------------
// 9. At zero weights the win log-likelihood is -log(n).
// -----------------------------------------------------------------------------
TEST(SoftmaxWinModelTest, ZeroWeightLikelihoodIsUniform) {
  const SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  EXPECT_NEAR(model.eventLogLikelihood(handEvent(1, {0.1, 0.2, 0.3, 0.4}, 2)),
              -std::log(4.0), 1e-12);
}

// -----------------------------------------------------------------------------
// 10. Plackett-Luce at zero weights: -log of the stage sizes; non-finishers
//     stay in every stage's denominator.
// -----------------------------------------------------------------------------
TEST(PlackettLuceModelTest, ZeroWeightLikelihoodCountsStages) {
  const PlackettLuceModel model(modelConfig(ModelVariant::PlackettLuce));

  const auto full = handEvent(1, {0.1, 0.2, 0.3, 0.4}, 2, {2, 0, 3, 1});
  EXPECT_NEAR(model.eventLogLikelihood(full), -std::log(24.0), 1e-12);

  const auto partial = handEvent(2, {0.1, 0.2, 0.3, 0.4}, 2, {2, 0});
  EXPECT_NEAR(model.eventLogLikelihood(partial), -std::log(12.0), 1e-12);
}

// -----------------------------------------------------------------------------
// 11. Plackett-Luce learns from the whole order, not just the winner.
// -----------------------------------------------------------------------------
TEST(PlackettLuceModelTest, LearnsFromFullFinishingOrder) {
  std::vector<EventFeatures> training;
  for (turf::domain::EventId id = 1; id <= 20; ++id) {
    training.push_back(handEvent(id, {0.2, 0.8, 0.5}, 1, {1, 2, 0}));
  }
  PlackettLuceModel model(modelConfig(ModelVariant::PlackettLuce));
  const auto summary = model.fit(training);

  EXPECT_EQ(summary.events_used, 20u);
  EXPECT_GT(model.weights()[turf::kCompetitorRating], 0.0);

  const auto p = model.predict(training.front());
  EXPECT_GT(p.probabilities[1], p.probabilities[2]);
  EXPECT_GT(p.probabilities[2], p.probabilities[0]);
  EXPECT_NEAR(p.probabilities.sum(), 1.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 12. Fitted on a synthetic season, the model beats the uniform baseline.
// -----------------------------------------------------------------------------
TEST(SoftmaxWinModelTest, FitsSyntheticSeasonBetterThanUniform) {
  const turf::EventTimeline timeline(turf_test::syntheticSeason(150));
  const turf::RatingUpdateEngine engine(turf_test::ratingConfig());
  turf::RatingStore store;
  engine.replay(store, timeline);

  const turf::FeatureAssembler assembler(store, engine);
  std::vector<EventFeatures> training;
  for (const auto& e : timeline.events()) {
    training.push_back(assembler.assemble(e));
  }

  SoftmaxWinModel model(modelConfig(ModelVariant::Softmax));
  const auto summary = model.fit(training);
  EXPECT_EQ(summary.events_used, 150u);
  EXPECT_LT(summary.final_loss, std::log(6.0));
  EXPECT_GT(model.weights()[turf::kCompetitorRating], 0.0);
}

// -----------------------------------------------------------------------------
// 13. The factory builds the configured variant and validates the config.
// -----------------------------------------------------------------------------
TEST(RaceModelFactoryTest, BuildsConfiguredVariant) {
  auto softmax = turf::makeRaceModel(modelConfig(ModelVariant::Softmax));
  EXPECT_EQ(softmax->variant(), ModelVariant::Softmax);
  EXPECT_FALSE(softmax->isFitted());

  auto pl = turf::makeRaceModel(modelConfig(ModelVariant::PlackettLuce));
  EXPECT_EQ(pl->variant(), ModelVariant::PlackettLuce);

  auto bad = modelConfig(ModelVariant::Softmax);
  bad.l2_penalty = -1.0;
  EXPECT_THROW(turf::makeRaceModel(bad), turf::ConfigError);
}

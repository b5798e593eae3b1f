// =============================================================================
// rating_update_engine_test.cpp
// =============================================================================
// Unit tests for turf::RatingUpdateEngine and turf::UpdateStrategy.
//
// Validates:
//   - The recency-weighted update on a hand-computed three-race sequence
//   - perf(rank) and the two non-finisher policies
//   - Agent shrinkage toward the population mean
//   - Races sharing a timestamp chain their updates in event-id order
//   - Ordering violations and pending events are rejected
//   - Replays are deterministic and honour cancellation
// =============================================================================

#include "turf/errors.hpp"
#include "turf/rating/rating_update_engine.hpp"
#include "turf/rating/update_strategy.hpp"
#include "turf/timeline/event_timeline.hpp"

#include "race_fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

using turf::DegenerateInputError;
using turf::EventTimeline;
using turf::OrderingError;
using turf::RatingStore;
using turf::RatingUpdateEngine;
using turf::domain::EntityKey;
using turf::domain::EntityKind;
using turf_test::race;
using turf_test::ratingConfig;

namespace {

EntityKey competitor(turf::domain::EntityId id, const std::string& stratum = "") {
  return EntityKey{EntityKind::Competitor, id, stratum};
}

double latestRating(const RatingStore& store, const EntityKey& key) {
  auto s = store.latest(key);
  EXPECT_TRUE(s.has_value()) << turf::domain::describe(key);
  return s ? s->rating : -1.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. A beats B, B beats A, A beats B with alpha 0.3 and default 0.5.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, TwoRunnerSequenceMatchesHandComputation) {
  const RatingUpdateEngine engine(ratingConfig(0.3, 0.5));
  RatingStore store;
  const turf::domain::EntityId A = 1;
  const turf::domain::EntityId B = 2;

  engine.update(store, race(1, 1000, {A, B}));
  EXPECT_NEAR(latestRating(store, competitor(A)), 0.65, 1e-12);
  EXPECT_NEAR(latestRating(store, competitor(B)), 0.35, 1e-12);

  engine.update(store, race(2, 2000, {B, A}));
  EXPECT_NEAR(latestRating(store, competitor(A)), 0.455, 1e-12);
  EXPECT_NEAR(latestRating(store, competitor(B)), 0.545, 1e-12);

  engine.update(store, race(3, 3000, {A, B}));
  EXPECT_NEAR(latestRating(store, competitor(A)), 0.6185, 1e-12);
  EXPECT_NEAR(latestRating(store, competitor(B)), 0.3815, 1e-12);

  // Point-in-time: the rating that E3 saw is the one E2 produced.
  EXPECT_NEAR(store.ratingBefore(competitor(A), 3000)->rating, 0.455, 1e-12);
  EXPECT_EQ(store.history(competitor(A)).size(), 3u);
}

// -----------------------------------------------------------------------------
// 2. perf(rank) is strictly decreasing in rank, 1 for the winner, 0 for last.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, FinishPerformanceIsStrictlyDecreasing) {
  for (std::size_t n = 2; n <= 12; ++n) {
    EXPECT_DOUBLE_EQ(turf::finishPerformance(1, n, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(turf::finishPerformance(static_cast<int>(n), n, 1.0), 0.0);
    for (int r = 1; r < static_cast<int>(n); ++r) {
      EXPECT_GT(turf::finishPerformance(r, n, 1.0),
                turf::finishPerformance(r + 1, n, 1.0));
    }
  }
  EXPECT_DOUBLE_EQ(turf::finishPerformance(1, 1, 0.75), 0.75);
  EXPECT_THROW(turf::finishPerformance(0, 4, 1.0), DegenerateInputError);
  EXPECT_THROW(turf::finishPerformance(5, 4, 1.0), DegenerateInputError);
}

// -----------------------------------------------------------------------------
// 3. Non-finisher scoring under both policies.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, NonFinisherPolicies) {
  // Five runners: three finish, two do not.
  auto e = race(1, 1000, {1, 2, 3});
  e.entrants.push_back(turf_test::runner(4, std::nullopt, true));
  e.entrants.push_back(turf_test::runner(5, std::nullopt, true));
  e.n_runners = 5;

  auto fixed_cfg = ratingConfig();
  fixed_cfg.non_finisher_policy =
      turf::domain::NonFinisherPolicy{turf::domain::NonFinisherMode::Fixed, 0.1};
  RatingStore fixed_store;
  RatingUpdateEngine(fixed_cfg).update(fixed_store, e);
  EXPECT_NEAR(latestRating(fixed_store, competitor(4)), 0.3 * 0.1 + 0.35, 1e-12);

  auto below_cfg = ratingConfig();
  below_cfg.non_finisher_policy = turf::domain::NonFinisherPolicy{
      turf::domain::NonFinisherMode::BelowLastFinisher, 0.0};
  RatingStore below_store;
  RatingUpdateEngine(below_cfg).update(below_store, e);

  // Last finisher scores 1 - 2/4 = 0.5; non-finishers 1 - 3/4 = 0.25.
  EXPECT_NEAR(latestRating(below_store, competitor(3)), 0.3 * 0.5 + 0.35, 1e-12);
  EXPECT_NEAR(latestRating(below_store, competitor(5)), 0.3 * 0.25 + 0.35,
              1e-12);
  EXPECT_LT(turf::nonFinisherPerformance(*below_cfg.non_finisher_policy, 3, 5),
            turf::finishPerformance(3, 5, 1.0));
}

// -----------------------------------------------------------------------------
// 4. Without a non-finisher policy the engine refuses to start.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, MissingNonFinisherPolicyIsConfigError) {
  auto cfg = ratingConfig();
  cfg.non_finisher_policy.reset();
  EXPECT_THROW(RatingUpdateEngine engine(cfg), turf::ConfigError);

  auto bad_alpha = ratingConfig(0.0);
  EXPECT_THROW(RatingUpdateEngine engine(bad_alpha), turf::ConfigError);
}

// -----------------------------------------------------------------------------
// 5. An event earlier than the store's watermark is an ordering violation.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, RejectsOutOfOrderEvent) {
  const RatingUpdateEngine engine(ratingConfig());
  RatingStore store;
  engine.update(store, race(2, 2000, {1, 2}));

  EXPECT_THROW(engine.update(store, race(1, 1000, {3, 4})), OrderingError);
  EXPECT_THROW(engine.update(store, race(2, 2000, {1, 2})), OrderingError);
  EXPECT_EQ(store.snapshotCount(), 2u);
}

// -----------------------------------------------------------------------------
// 6. A pending event cannot update ratings; replay skips it.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, PendingEventsAreNotRated) {
  const RatingUpdateEngine engine(ratingConfig());
  RatingStore store;
  EXPECT_THROW(engine.update(store, turf_test::pendingRace(1, 1000, {1, 2})),
               DegenerateInputError);

  EventTimeline timeline({race(1, 1000, {1, 2}),
                          turf_test::pendingRace(2, 2000, {1, 2})});
  const auto stats = engine.replay(store, timeline);
  EXPECT_EQ(stats.events_applied, 1u);
  EXPECT_EQ(stats.pending_skipped, 1u);
  EXPECT_EQ(stats.snapshots_appended, 2u);
  EXPECT_FALSE(stats.cancelled);
}

// -----------------------------------------------------------------------------
// 7. Agent ratings shrink toward the prior mean with n / (n + k) confidence.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, AgentRatingShrinksTowardMean) {
  auto e = race(1, 1000, {1, 2});
  e.entrants[0].agents.push_back({EntityKind::Jockey, 100});
  e.entrants[1].agents.push_back({EntityKind::Jockey, 101});

  auto cfg = ratingConfig();
  cfg.agent_prior_strength = 10.0;
  const RatingUpdateEngine engine(cfg);
  RatingStore store;
  engine.update(store, e);

  const auto s = store.latest(EntityKey{EntityKind::Jockey, 100, ""});
  ASSERT_TRUE(s.has_value());
  EXPECT_NEAR(s->raw_rating, 0.65, 1e-12);
  EXPECT_NEAR(s->rating, (0.65 * 1.0 + 0.5 * 10.0) / 11.0, 1e-12);
  EXPECT_EQ(s->observations, 1u);

  EXPECT_DOUBLE_EQ(engine.agentStrategy().confidence(10), 0.5);
  EXPECT_DOUBLE_EQ(engine.competitorStrategy().confidence(1), 1.0);
}

// -----------------------------------------------------------------------------
// 8. An agent with two runners in one race is updated once, on their mean.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, AgentWithTwoRunnersUpdatedOnce) {
  auto e = race(1, 1000, {1, 2});
  e.entrants[0].agents.push_back({EntityKind::Trainer, 200});
  e.entrants[1].agents.push_back({EntityKind::Trainer, 200});

  const RatingUpdateEngine engine(ratingConfig());
  RatingStore store;
  const std::size_t appended = engine.update(store, e);
  EXPECT_EQ(appended, 3u);

  const auto history = store.history(EntityKey{EntityKind::Trainer, 200, ""});
  ASSERT_EQ(history.size(), 1u);
  EXPECT_NEAR(history[0].raw_rating, 0.3 * 0.5 + 0.7 * 0.5, 1e-12);
}

// -----------------------------------------------------------------------------
// 9. With partitioning on, each stratum keeps its own rating.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, StratumPartitionKeepsSeparateRatings) {
  auto cfg = ratingConfig();
  cfg.partition_by_stratum = true;
  const RatingUpdateEngine engine(cfg);
  RatingStore store;

  engine.update(store, race(1, 1000, {1, 2}, "flat"));
  engine.update(store, race(2, 2000, {2, 1}, "hurdle"));

  EXPECT_NEAR(latestRating(store, competitor(1, "flat")), 0.65, 1e-12);
  EXPECT_NEAR(latestRating(store, competitor(1, "hurdle")), 0.35, 1e-12);
  EXPECT_FALSE(store.latest(competitor(1)).has_value());

  const auto e = race(3, 3000, {1, 2}, "hurdle");
  EXPECT_EQ(engine.keyFor(EntityKind::Competitor, 1, e).stratum, "hurdle");
}

// -----------------------------------------------------------------------------
// 10. Population-mean cold start seeds newcomers from earlier performances.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, PopulationMeanColdStart) {
  auto cfg = ratingConfig(0.3, 0.2);
  cfg.cold_start = turf::domain::ColdStartMode::PopulationMean;
  const RatingUpdateEngine engine(cfg);
  RatingStore store;

  // First event: no population yet, so the fixed default applies.
  engine.update(store, race(1, 1000, {1, 2}));
  EXPECT_NEAR(latestRating(store, competitor(2)), 0.7 * 0.2, 1e-12);

  // Competitor 4 debuts with the mean performance so far, (1 + 0) / 2.
  engine.update(store, race(2, 2000, {1, 4}));
  EXPECT_NEAR(latestRating(store, competitor(4)), 0.7 * 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(
      engine.coldStartRating(store, EntityKind::Competitor, "", 1000), 0.2);
}

// -----------------------------------------------------------------------------
// 11. Replaying the same season twice yields identical rating rows.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, ReplayIsDeterministic) {
  const EventTimeline timeline(turf_test::syntheticSeason(60));
  const RatingUpdateEngine engine(ratingConfig());

  RatingStore first;
  RatingStore second;
  engine.replay(first, timeline);
  engine.replay(second, timeline);

  const auto a = first.rows();
  const auto b = second.rows();
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].entity, b[i].entity);
    EXPECT_EQ(a[i].event_id, b[i].event_id);
    EXPECT_EQ(a[i].rating, b[i].rating);
  }
}

// -----------------------------------------------------------------------------
// 12. A raised cancel flag stops the replay before the next event.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, ReplayStopsWhenCancelled) {
  const EventTimeline timeline(turf_test::syntheticSeason(10));
  const RatingUpdateEngine engine(ratingConfig());
  RatingStore store;
  const std::atomic<bool> cancel{true};

  const auto stats = engine.replay(store, timeline, &cancel);
  EXPECT_TRUE(stats.cancelled);
  EXPECT_EQ(stats.events_applied, 0u);
  EXPECT_EQ(store.snapshotCount(), 0u);
}

// -----------------------------------------------------------------------------
// 13. Two races off at the same time: the second one continues from the
//     snapshot the first one committed, while feature lookups at that time
//     still see neither.
// -----------------------------------------------------------------------------
TEST(RatingUpdateEngineTest, SameTimestampRacesChainAgentUpdates) {
  auto cfg = ratingConfig(0.3, 0.5);
  cfg.agent_prior_strength = 0.0;
  const RatingUpdateEngine engine(cfg);
  RatingStore store;
  const EntityKey trainer{EntityKind::Trainer, 77, ""};

  auto york = race(1, 1000, {1, 2});
  york.entrants[0].agents.push_back({EntityKind::Trainer, 77});
  auto ascot = race(2, 1000, {3, 4});
  ascot.entrants[0].agents.push_back({EntityKind::Trainer, 77});

  engine.update(store, york);
  engine.update(store, ascot);

  const auto history = store.history(trainer);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_NEAR(history[0].rating, 0.65, 1e-12);
  EXPECT_EQ(history[0].observations, 1u);
  EXPECT_NEAR(history[1].rating, 0.3 * 1.0 + 0.7 * 0.65, 1e-12);
  EXPECT_EQ(history[1].observations, 2u);

  EXPECT_FALSE(store.ratingBefore(trainer, 1000).has_value());
  EXPECT_NEAR(store.ratingBefore(trainer, 1001)->rating, 0.755, 1e-12);
}

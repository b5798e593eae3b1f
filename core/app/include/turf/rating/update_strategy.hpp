#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/event.hpp"

#include <cstddef>
#include <cstdint>

namespace turf {

// -------------------------------------------------------------------------
// finishPerformance(rank, n_runners, single_runner_performance)
// -------------------------------------------------------------------------
// @brief  Maps a finishing rank to a bounded performance score in [0, 1].
//
// @details
//   n_runners > 1 : 1 - (rank - 1) / (n_runners - 1)
//   n_runners = 1 : single_runner_performance
// Strictly decreasing in rank for a fixed field: rank 1 scores 1.0 and rank
// n_runners scores 0.0.
// -------------------------------------------------------------------------
double finishPerformance(int rank, std::size_t n_runners,
                         double single_runner_performance);

// -------------------------------------------------------------------------
// nonFinisherPerformance(policy, finishers, n_runners)
// -------------------------------------------------------------------------
// @brief  Performance of a runner that did not finish, per the configured
//         NonFinisherPolicy (see engine_config.hpp).
// -------------------------------------------------------------------------
double nonFinisherPerformance(const domain::NonFinisherPolicy& policy,
                              std::size_t finishers, std::size_t n_runners);

// -----------------------------------------------------------------------------
// UpdateRule
// -----------------------------------------------------------------------------
//   ExponentialDecay — new = alpha * perf + (1 - alpha) * old.
//   ShrinkageToMean  — the same recursion on a raw value, then
//                      rating = c * raw + (1 - c) * population_mean with
//                      confidence c = n / (n + k).
// -----------------------------------------------------------------------------
enum class UpdateRule : std::uint8_t { ExponentialDecay, ShrinkageToMean };

// Rating state carried from the previous snapshot (or the cold start).
struct PriorRating {
  double raw_rating{0.0};
  std::uint32_t observations{0};
};

struct UpdatedRating {
  double rating{0.0};
  double raw_rating{0.0};
  std::uint32_t observations{0};
  double confidence{1.0};
};

// -----------------------------------------------------------------------------
// UpdateStrategy — closed set of rating update rules behind one interface
// -----------------------------------------------------------------------------
//
// @brief  Value type that scores an entrant's performance and folds that
//         score into an entity's prior rating.
//
// @details
// The two rules differ only in how the blended value is finalised, so they
// share one small class selected by a tag rather than a class hierarchy.
// Competitors use ExponentialDecay; jockeys and trainers use
// ShrinkageToMean so that an agent with a handful of rides regresses
// strongly toward the population mean, and the pull weakens monotonically
// as observations accumulate.
//
// Thread model: Immutable after construction; safe to share.
// -----------------------------------------------------------------------------
class UpdateStrategy {
 public:
  static UpdateStrategy exponentialDecay(const domain::RatingConfig& config,
                                         double alpha);
  static UpdateStrategy shrinkageToMean(const domain::RatingConfig& config,
                                        double alpha, double prior_strength);

  UpdateRule rule() const { return rule_; }
  double alpha() const { return alpha_; }

  // -------------------------------------------------------------------------
  // performance(event, entrant)
  // -------------------------------------------------------------------------
  // @brief  Bounded performance in [0, 1] of a settled entrant.
  //
  // @details
  // Finishers use finishPerformance() against the declared field size.
  // Non-finishers use the configured NonFinisherPolicy.
  // -------------------------------------------------------------------------
  double performance(const domain::Event& event,
                     const domain::Entrant& entrant) const;

  // n / (n + k) for ShrinkageToMean, 1.0 for ExponentialDecay. Strictly
  // increasing in n whenever k > 0.
  double confidence(std::uint32_t observations) const;

  // -------------------------------------------------------------------------
  // update(prior, score, population_mean)
  // -------------------------------------------------------------------------
  // @brief  Folds one performance score into a prior rating.
  //
  // @param  prior            Raw value and observation count before the
  //                          event.
  // @param  score            This event's performance in [0, 1].
  // @param  population_mean  Shrinkage target; ignored by ExponentialDecay.
  //
  // @return The post-event rating, raw value, count, and confidence used.
  // -------------------------------------------------------------------------
  UpdatedRating update(const PriorRating& prior, double score,
                       double population_mean) const;

 private:
  UpdateStrategy(UpdateRule rule, double alpha, double prior_strength,
                 double single_runner_performance,
                 domain::NonFinisherPolicy non_finisher);

  UpdateRule rule_;
  double alpha_;
  double prior_strength_;
  double single_runner_performance_;
  domain::NonFinisherPolicy non_finisher_;
};

}  // namespace turf

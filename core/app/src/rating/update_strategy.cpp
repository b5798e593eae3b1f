#include "turf/rating/update_strategy.hpp"
#include "turf/errors.hpp"

#include <algorithm>

namespace turf {

double finishPerformance(int rank, std::size_t n_runners,
                         double single_runner_performance) {
  if (n_runners == 0 || rank < 1 || static_cast<std::size_t>(rank) > n_runners) {
    throw DegenerateInputError("finish rank " + std::to_string(rank) +
                               " outside field of " +
                               std::to_string(n_runners));
  }
  if (n_runners == 1) {
    return single_runner_performance;
  }
  return 1.0 - static_cast<double>(rank - 1) /
                   static_cast<double>(n_runners - 1);
}

double nonFinisherPerformance(const domain::NonFinisherPolicy& policy,
                              std::size_t finishers, std::size_t n_runners) {
  switch (policy.mode) {
    case domain::NonFinisherMode::Fixed:
      return policy.value;
    case domain::NonFinisherMode::BelowLastFinisher:
      if (n_runners <= 1) {
        return 0.0;
      }
      return std::clamp(1.0 - static_cast<double>(finishers) /
                                  static_cast<double>(n_runners - 1),
                        0.0, 1.0);
  }
  return 0.0;
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
UpdateStrategy::UpdateStrategy(UpdateRule rule, double alpha,
                               double prior_strength,
                               double single_runner_performance,
                               domain::NonFinisherPolicy non_finisher)
    : rule_(rule),
      alpha_(alpha),
      prior_strength_(prior_strength),
      single_runner_performance_(single_runner_performance),
      non_finisher_(non_finisher) {}

UpdateStrategy UpdateStrategy::exponentialDecay(
    const domain::RatingConfig& config, double alpha) {
  config.validate();
  return UpdateStrategy(UpdateRule::ExponentialDecay, alpha, 0.0,
                        config.single_runner_performance,
                        *config.non_finisher_policy);
}

UpdateStrategy UpdateStrategy::shrinkageToMean(
    const domain::RatingConfig& config, double alpha, double prior_strength) {
  config.validate();
  return UpdateStrategy(UpdateRule::ShrinkageToMean, alpha, prior_strength,
                        config.single_runner_performance,
                        *config.non_finisher_policy);
}

// -----------------------------------------------------------------------------
// performance
// -----------------------------------------------------------------------------
double UpdateStrategy::performance(const domain::Event& event,
                                   const domain::Entrant& entrant) const {
  if (!event.isSettled()) {
    throw DegenerateInputError("performance requested for unsettled " +
                               domain::describe(event.key()));
  }
  if (entrant.outcome.finished()) {
    return finishPerformance(*entrant.outcome.finish_position, event.n_runners,
                             single_runner_performance_);
  }
  return nonFinisherPerformance(non_finisher_, event.finisherCount(),
                                event.n_runners);
}

double UpdateStrategy::confidence(std::uint32_t observations) const {
  if (rule_ == UpdateRule::ExponentialDecay || prior_strength_ <= 0.0) {
    return 1.0;
  }
  const double n = static_cast<double>(observations);
  return n / (n + prior_strength_);
}

// -----------------------------------------------------------------------------
// update
// -----------------------------------------------------------------------------
UpdatedRating UpdateStrategy::update(const PriorRating& prior, double score,
                                     double population_mean) const {
  UpdatedRating out;
  out.observations = prior.observations + 1;
  out.raw_rating = alpha_ * score + (1.0 - alpha_) * prior.raw_rating;

  if (rule_ == UpdateRule::ExponentialDecay) {
    out.rating = out.raw_rating;
    out.confidence = 1.0;
    return out;
  }

  out.confidence = confidence(out.observations);
  out.rating = out.confidence * out.raw_rating +
               (1.0 - out.confidence) * population_mean;
  return out;
}

}  // namespace turf

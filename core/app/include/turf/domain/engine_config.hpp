#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace turf {
namespace domain {

// -----------------------------------------------------------------------------
// NonFinisherPolicy — performance assigned to runners that did not finish
// -----------------------------------------------------------------------------
//
// @brief  Explicit policy for the performance score of a non-finisher.
//
// @details
// There is no default: RatingConfig::validate() rejects a configuration
// that leaves the policy unset. Two forms are supported:
//
//   Fixed              — every non-finisher scores `value` (in [0, 1]).
//   BelowLastFinisher  — a field-size dependent floor: the non-finisher is
//                        scored as if it had finished at rank k + 1, where
//                        k is the number of finishers, i.e.
//                          perf = 1 - k / (n_runners - 1)
//                        clamped to [0, 1]. In a field of one this is 0.
// -----------------------------------------------------------------------------
enum class NonFinisherMode : std::uint8_t { Fixed, BelowLastFinisher };

struct NonFinisherPolicy {
  NonFinisherMode mode{NonFinisherMode::Fixed};
  double value{0.0};  // Used by Fixed only
};

// -----------------------------------------------------------------------------
// ColdStartMode — rating used before an entity's first snapshot
// -----------------------------------------------------------------------------
//   Fixed          — RatingConfig::default_rating.
//   PopulationMean — mean performance of all earlier observations of the
//                    same entity kind (and stratum, when partitioned);
//                    default_rating when nothing has been observed yet.
// -----------------------------------------------------------------------------
enum class ColdStartMode : std::uint8_t { Fixed, PopulationMean };

// -----------------------------------------------------------------------------
// RatingConfig
// -----------------------------------------------------------------------------
//
// @brief  Parameters of the recency-weighted rating recursion.
//
// @details
//   alpha                   — competitor recency weight in (0, 1]. Larger
//                             values forget history faster.
//   agent_alpha             — the same for jockeys and trainers.
//   agent_prior_strength    — k in the agent confidence n / (n + k).
//                             0 disables shrinkage.
//   partition_by_stratum    — keep an independent history per stratum.
//   rate_agents             — whether jockeys/trainers are rated at all.
// -----------------------------------------------------------------------------
struct RatingConfig {
  double alpha{0.3};
  double agent_alpha{0.3};
  double default_rating{0.5};
  ColdStartMode cold_start{ColdStartMode::Fixed};
  double single_runner_performance{1.0};
  std::optional<NonFinisherPolicy> non_finisher_policy;
  double agent_prior_strength{10.0};
  bool partition_by_stratum{false};
  bool rate_agents{true};

  // Throws ConfigError on the first invalid field.
  void validate() const;
};

// -----------------------------------------------------------------------------
// ModelVariant / ModelConfig
// -----------------------------------------------------------------------------
//
// @brief  Which race-wise likelihood the linear scorer is trained under, and
//         the optimiser settings.
//
// @details
// Training is full-batch gradient descent with Armijo backtracking from zero
// weights. Given the same data in the same order it is bit-for-bit
// reproducible; `seed` is recorded in reports but no random draws are made.
// -----------------------------------------------------------------------------
enum class ModelVariant : std::uint8_t { Softmax, PlackettLuce };

struct ModelConfig {
  ModelVariant variant{ModelVariant::Softmax};
  double l2_penalty{1e-3};
  std::size_t max_iterations{500};
  double convergence_tolerance{1e-10};
  double initial_step{1.0};
  std::uint64_t seed{0};

  // Maximum permitted |sum(p) - 1| before a prediction is renormalised and
  // counted as a numerical incident.
  double probability_tolerance{1e-9};

  void validate() const;
};

// -----------------------------------------------------------------------------
// EvaluationConfig
// -----------------------------------------------------------------------------
//
// @brief  Fold layout and execution settings of the forward-chaining
//         backtest.
//
// @details
//   warmup_events       — number of leading settled events that are never
//                         scored, only used for training.
//   test_window_events  — target size of each test window. Windows are
//                         extended so that no timestamp straddles a fold
//                         boundary.
//   max_train_events    — 0 for an expanding window; otherwise only the
//                         most recent N events before the boundary train.
//   calibration_bins    — equal-width probability bins in [0, 1].
//   worker_threads      — folds trained and scored concurrently.
// -----------------------------------------------------------------------------
struct EvaluationConfig {
  std::size_t warmup_events{0};
  std::size_t test_window_events{100};
  std::size_t max_train_events{0};
  std::size_t calibration_bins{10};
  std::size_t worker_threads{1};

  void validate() const;
};

struct EngineConfig {
  RatingConfig rating;
  ModelConfig model;
  EvaluationConfig evaluation;

  void validate() const;
};

}  // namespace domain
}  // namespace turf

#include "turf/domain/engine_config.hpp"
#include "turf/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace turf {
namespace domain {

namespace {

void requireUnitInterval(const char* name, double value, bool allow_zero) {
  const bool ok = std::isfinite(value) && value <= 1.0 &&
                  (allow_zero ? value >= 0.0 : value > 0.0);
  if (!ok) {
    std::ostringstream os;
    os << name << " must lie in " << (allow_zero ? "[0, 1]" : "(0, 1]")
       << ", got " << value;
    throw ConfigError(os.str());
  }
}

}  // namespace

void RatingConfig::validate() const {
  requireUnitInterval("rating.alpha", alpha, false);
  requireUnitInterval("rating.agent_alpha", agent_alpha, false);
  requireUnitInterval("rating.default_rating", default_rating, true);
  requireUnitInterval("rating.single_runner_performance",
                      single_runner_performance, true);

  if (!non_finisher_policy) {
    throw ConfigError(
        "rating.non_finisher_policy is required (\"fixed\" with a value, or "
        "\"below_last_finisher\")");
  }
  if (non_finisher_policy->mode == NonFinisherMode::Fixed) {
    requireUnitInterval("rating.non_finisher_policy.value",
                        non_finisher_policy->value, true);
  }

  if (!std::isfinite(agent_prior_strength) || agent_prior_strength < 0.0) {
    throw ConfigError("rating.agent_prior_strength must be >= 0, got " +
                      std::to_string(agent_prior_strength));
  }
}

void ModelConfig::validate() const {
  if (!std::isfinite(l2_penalty) || l2_penalty < 0.0) {
    throw ConfigError("model.l2_penalty must be >= 0, got " +
                      std::to_string(l2_penalty));
  }
  if (max_iterations == 0) {
    throw ConfigError("model.max_iterations must be positive");
  }
  if (!std::isfinite(convergence_tolerance) || convergence_tolerance < 0.0) {
    throw ConfigError("model.convergence_tolerance must be >= 0");
  }
  if (!std::isfinite(initial_step) || initial_step <= 0.0) {
    throw ConfigError("model.initial_step must be > 0");
  }
  if (!std::isfinite(probability_tolerance) || probability_tolerance <= 0.0) {
    throw ConfigError("model.probability_tolerance must be > 0");
  }
}

void EvaluationConfig::validate() const {
  if (test_window_events == 0) {
    throw ConfigError("evaluation.test_window_events must be positive");
  }
  if (calibration_bins == 0) {
    throw ConfigError("evaluation.calibration_bins must be positive");
  }
  if (worker_threads == 0) {
    throw ConfigError("evaluation.worker_threads must be positive");
  }
}

void EngineConfig::validate() const {
  rating.validate();
  model.validate();
  evaluation.validate();
}

}  // namespace domain
}  // namespace turf

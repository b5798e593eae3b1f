#include "turf/model/linear_race_model.hpp"
#include "turf/errors.hpp"
#include "turf/model/softmax.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace turf {

namespace {

constexpr double kArmijo = 1e-4;
constexpr double kMinStep = 1e-20;

}  // namespace

LinearRaceModel::LinearRaceModel(const domain::ModelConfig& config)
    : config_(config),
      weights_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(kFeatureCount))) {
  config_.validate();
}

// -----------------------------------------------------------------------------
// objective: mean negative log-likelihood plus the ridge term
// -----------------------------------------------------------------------------
double LinearRaceModel::objective(
    const std::vector<Eigen::MatrixXd>& xs,
    const std::vector<const EventFeatures*>& events, const Eigen::VectorXd& w,
    Eigen::VectorXd* grad) const {
  const double m = static_cast<double>(events.size());
  double loglik = 0.0;
  Eigen::VectorXd g;
  if (grad != nullptr) {
    g = Eigen::VectorXd::Zero(w.size());
  }

  for (std::size_t e = 0; e < events.size(); ++e) {
    const Eigen::VectorXd s = xs[e] * w;
    loglik += logLikelihood(xs[e], s, *events[e], grad ? &g : nullptr);
  }

  if (grad != nullptr) {
    *grad = -g / m + config_.l2_penalty * w;
  }
  return -loglik / m + 0.5 * config_.l2_penalty * w.squaredNorm();
}

// -----------------------------------------------------------------------------
// fit
// -----------------------------------------------------------------------------
FitSummary LinearRaceModel::fit(const std::vector<EventFeatures>& training) {
  FitSummary summary;

  std::vector<const EventFeatures*> usable;
  usable.reserve(training.size());
  for (const auto& event : training) {
    if (!event.settled) {
      std::ostringstream os;
      os << "training on unsettled " << domain::describe(event.key);
      throw DegenerateInputError(os.str());
    }
    if (usableForTraining(event)) {
      usable.push_back(&event);
    } else {
      ++summary.events_excluded;
    }
  }
  summary.events_used = usable.size();

  standardizer_.fit(training);
  weights_ = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(kFeatureCount));
  fitted_ = true;

  if (usable.empty()) {
    summary.converged = true;
    return summary;
  }

  std::vector<Eigen::MatrixXd> xs;
  xs.reserve(usable.size());
  for (const auto* event : usable) {
    xs.push_back(standardizer_.transform(*event));
  }

  Eigen::VectorXd w = weights_;
  Eigen::VectorXd grad;
  double loss = objective(xs, usable, w, &grad);

  for (std::size_t it = 0; it < config_.max_iterations; ++it) {
    const double grad_sq = grad.squaredNorm();
    if (std::sqrt(grad_sq) < config_.convergence_tolerance) {
      summary.converged = true;
      break;
    }

    double step = config_.initial_step;
    Eigen::VectorXd candidate;
    double candidate_loss = loss;
    bool accepted = false;
    while (step > kMinStep) {
      candidate = w - step * grad;
      candidate_loss = objective(xs, usable, candidate, nullptr);
      if (std::isfinite(candidate_loss) &&
          candidate_loss <= loss - kArmijo * step * grad_sq) {
        accepted = true;
        break;
      }
      step *= 0.5;
    }
    if (!accepted) {
      summary.converged = true;
      break;
    }

    ++summary.iterations;
    const double previous = loss;
    w = candidate;
    loss = objective(xs, usable, w, &grad);
    if (std::abs(previous - loss) <=
        config_.convergence_tolerance * std::max(1.0, std::abs(previous))) {
      summary.converged = true;
      break;
    }
  }

  weights_ = w;
  summary.final_loss = loss;
  return summary;
}

Eigen::VectorXd LinearRaceModel::score(const EventFeatures& event) const {
  if (event.size() == 0) {
    std::ostringstream os;
    os << "cannot score " << domain::describe(event.key)
       << " with zero entrants";
    throw DegenerateInputError(os.str());
  }
  return standardizer_.transform(event) * weights_;
}

Prediction LinearRaceModel::predict(const EventFeatures& event) const {
  Prediction out;
  out.key = event.key;
  out.entrant_ids.reserve(event.rows.size());
  for (const auto& row : event.rows) {
    out.entrant_ids.push_back(row.entrant_id);
  }
  out.scores = score(event);

  Normalized normalized =
      normalizeScores(out.scores, config_.probability_tolerance);
  out.probabilities = std::move(normalized.probabilities);
  out.numerical_fallback = normalized.fallback;
  out.fallback_reason = std::move(normalized.reason);
  return out;
}

double LinearRaceModel::eventLogLikelihood(const EventFeatures& event) const {
  if (!event.settled) {
    std::ostringstream os;
    os << "log-likelihood of unsettled " << domain::describe(event.key);
    throw DegenerateInputError(os.str());
  }
  const Eigen::MatrixXd x = standardizer_.transform(event);
  const Eigen::VectorXd s = x * weights_;
  return logLikelihood(x, s, event, nullptr);
}

}  // namespace turf

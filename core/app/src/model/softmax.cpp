#include "turf/model/softmax.hpp"
#include "turf/errors.hpp"

#include <cmath>
#include <utility>

namespace turf {

double logSumExp(const Eigen::VectorXd& scores) {
  if (scores.size() == 0) {
    throw DegenerateInputError("log-sum-exp over an empty score vector");
  }
  const double max = scores.maxCoeff();
  return max + std::log((scores.array() - max).exp().sum());
}

namespace {

Normalized uniform(Eigen::Index n, std::string reason) {
  Normalized out;
  out.probabilities =
      Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
  out.fallback = true;
  out.reason = std::move(reason);
  return out;
}

}  // namespace

Normalized normalizeScores(const Eigen::VectorXd& scores, double tolerance) {
  const Eigen::Index n = scores.size();
  if (n == 0) {
    throw DegenerateInputError("cannot normalise an event with zero entrants");
  }

  Normalized out;
  if (n == 1) {
    out.probabilities = Eigen::VectorXd::Ones(1);
    return out;
  }

  if (!scores.allFinite()) {
    return uniform(n, "non-finite score");
  }

  const double max = scores.maxCoeff();
  Eigen::VectorXd weights = (scores.array() - max).exp().matrix();
  const double total = weights.sum();

  // total >= 1 because the max entry contributes exp(0); anything else means
  // the arithmetic went wrong.
  if (!std::isfinite(total) || total < 1.0) {
    return uniform(n, "degenerate softmax normaliser");
  }

  out.probabilities = weights / total;
  if (std::abs(out.probabilities.sum() - 1.0) > tolerance) {
    return uniform(n, "probabilities do not sum to one");
  }
  return out;
}

}  // namespace turf

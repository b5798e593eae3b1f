#include "turf/model/plackett_luce_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace turf {

PlackettLuceModel::PlackettLuceModel(const domain::ModelConfig& config)
    : LinearRaceModel(config) {}

bool PlackettLuceModel::usableForTraining(const EventFeatures& event) const {
  return !event.finishing_order.empty() && event.size() >= 2;
}

double PlackettLuceModel::logLikelihood(const Eigen::MatrixXd& x,
                                        const Eigen::VectorXd& s,
                                        const EventFeatures& event,
                                        Eigen::VectorXd* grad) const {
  const auto n = static_cast<std::size_t>(s.size());
  std::vector<bool> remaining(n, true);
  std::size_t remaining_count = n;
  double loglik = 0.0;

  for (const std::size_t placed : event.finishing_order) {
    if (remaining_count < 2) {
      break;
    }

    // Stable log-sum-exp over the remaining entrants.
    double max = -std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
      if (remaining[i]) {
        max = std::max(max, s[static_cast<Eigen::Index>(i)]);
      }
    }
    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      if (remaining[i]) {
        total += std::exp(s[static_cast<Eigen::Index>(i)] - max);
      }
    }
    const double lse = max + std::log(total);
    const auto o = static_cast<Eigen::Index>(placed);
    loglik += s[o] - lse;

    if (grad != nullptr) {
      *grad += x.row(o).transpose();
      for (std::size_t i = 0; i < n; ++i) {
        if (remaining[i]) {
          const auto r = static_cast<Eigen::Index>(i);
          *grad -= std::exp(s[r] - lse) * x.row(r).transpose();
        }
      }
    }

    remaining[placed] = false;
    --remaining_count;
  }
  return loglik;
}

}  // namespace turf

#include "turf/model/feature_standardizer.hpp"

#include <cmath>

namespace turf {

void FeatureStandardizer::fit(const std::vector<EventFeatures>& events) {
  const auto d = static_cast<Eigen::Index>(kFeatureCount);
  Eigen::VectorXd sum = Eigen::VectorXd::Zero(d);
  Eigen::VectorXd sum_sq = Eigen::VectorXd::Zero(d);
  Eigen::VectorXd count = Eigen::VectorXd::Zero(d);

  for (const auto& event : events) {
    for (const auto& row : event.rows) {
      for (Eigen::Index j = 0; j < d; ++j) {
        const double x = row.values[j];
        if (std::isfinite(x)) {
          sum[j] += x;
          sum_sq[j] += x * x;
          count[j] += 1.0;
        }
      }
    }
  }

  mean_ = Eigen::VectorXd::Zero(d);
  scale_ = Eigen::VectorXd::Ones(d);
  for (Eigen::Index j = 0; j < d; ++j) {
    if (count[j] == 0.0) {
      continue;
    }
    mean_[j] = sum[j] / count[j];
    const double var = sum_sq[j] / count[j] - mean_[j] * mean_[j];
    if (var > 1e-12) {
      scale_[j] = std::sqrt(var);
    }
  }
}

Eigen::VectorXd FeatureStandardizer::transform(const Eigen::VectorXd& raw) const {
  Eigen::VectorXd out(raw.size());
  for (Eigen::Index j = 0; j < raw.size(); ++j) {
    out[j] = std::isfinite(raw[j]) ? (raw[j] - mean_[j]) / scale_[j] : 0.0;
  }
  return out;
}

Eigen::MatrixXd FeatureStandardizer::transform(const EventFeatures& event) const {
  Eigen::MatrixXd x(static_cast<Eigen::Index>(event.rows.size()),
                    static_cast<Eigen::Index>(kFeatureCount));
  for (std::size_t i = 0; i < event.rows.size(); ++i) {
    x.row(static_cast<Eigen::Index>(i)) =
        transform(event.rows[i].values).transpose();
  }
  return x;
}

}  // namespace turf

#pragma once

#include "turf/features/feature_assembler.hpp"

#include <Eigen/Dense>

#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// FeatureStandardizer
// -----------------------------------------------------------------------------
// Column-wise z-scoring fitted on training rows only. NaN inputs (missing
// static attributes) are skipped when fitting and mapped to 0 (the
// training mean) when transforming. Columns with zero spread keep a scale
// of 1 so they pass through centred.
// -----------------------------------------------------------------------------
class FeatureStandardizer {
 public:
  void fit(const std::vector<EventFeatures>& events);

  Eigen::VectorXd transform(const Eigen::VectorXd& raw) const;

  // Stacks the standardised rows of one event into an (entrants x features)
  // matrix.
  Eigen::MatrixXd transform(const EventFeatures& event) const;

  const Eigen::VectorXd& mean() const { return mean_; }
  const Eigen::VectorXd& scale() const { return scale_; }

 private:
  Eigen::VectorXd mean_ =
      Eigen::VectorXd::Zero(static_cast<Eigen::Index>(kFeatureCount));
  Eigen::VectorXd scale_ =
      Eigen::VectorXd::Ones(static_cast<Eigen::Index>(kFeatureCount));
};

}  // namespace turf

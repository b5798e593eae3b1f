#pragma once

#include "turf/model/linear_race_model.hpp"

namespace turf {

// -----------------------------------------------------------------------------
// SoftmaxWinModel — conditional logit on the winner only
// -----------------------------------------------------------------------------
//
//   loglik_e = s_winner - logSumExp(s)
//   d/dw     = x_winner - sum_i p_i x_i
//
// Events without a winner (every runner a non-finisher) and single-runner
// events carry no information about w and are excluded from training.
// eventLogLikelihood() of an event without a winner is 0.
// -----------------------------------------------------------------------------
class SoftmaxWinModel : public LinearRaceModel {
 public:
  explicit SoftmaxWinModel(const domain::ModelConfig& config);

  domain::ModelVariant variant() const override {
    return domain::ModelVariant::Softmax;
  }

 protected:
  bool usableForTraining(const EventFeatures& event) const override;
  double logLikelihood(const Eigen::MatrixXd& x, const Eigen::VectorXd& s,
                       const EventFeatures& event,
                       Eigen::VectorXd* grad) const override;
};

}  // namespace turf

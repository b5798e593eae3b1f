#pragma once

#include "turf/model/linear_race_model.hpp"

namespace turf {

// -----------------------------------------------------------------------------
// PlackettLuceModel — sequential-elimination likelihood of the full order
// -----------------------------------------------------------------------------
//
// @brief  Learns from every placing, not just the winner.
//
// @details
// With finishers o_1, o_2, ..., o_k in finishing order and R_j the set of
// entrants not yet placed before stage j:
//
//   loglik_e = sum_j [ s_{o_j} - logSumExp(s_{R_j}) ]
//
// Non-finishers are never placed, so they remain in every R_j: they were
// beaten by every finisher. A stage whose R_j holds a single entrant has
// probability 1 and is skipped.
//
// Win probabilities are the first stage, i.e. the same race-wise softmax
// as SoftmaxWinModel, only the weights differ.
// -----------------------------------------------------------------------------
class PlackettLuceModel : public LinearRaceModel {
 public:
  explicit PlackettLuceModel(const domain::ModelConfig& config);

  domain::ModelVariant variant() const override {
    return domain::ModelVariant::PlackettLuce;
  }

 protected:
  bool usableForTraining(const EventFeatures& event) const override;
  double logLikelihood(const Eigen::MatrixXd& x, const Eigen::VectorXd& s,
                       const EventFeatures& event,
                       Eigen::VectorXd* grad) const override;
};

}  // namespace turf

#include "turf/model/softmax_win_model.hpp"
#include "turf/model/softmax.hpp"

#include <cmath>

namespace turf {

SoftmaxWinModel::SoftmaxWinModel(const domain::ModelConfig& config)
    : LinearRaceModel(config) {}

bool SoftmaxWinModel::usableForTraining(const EventFeatures& event) const {
  return event.winner.has_value() && event.size() >= 2;
}

double SoftmaxWinModel::logLikelihood(const Eigen::MatrixXd& x,
                                      const Eigen::VectorXd& s,
                                      const EventFeatures& event,
                                      Eigen::VectorXd* grad) const {
  if (!event.winner) {
    return 0.0;
  }
  const auto w = static_cast<Eigen::Index>(*event.winner);
  const double lse = logSumExp(s);
  if (grad != nullptr) {
    const Eigen::VectorXd p = (s.array() - lse).exp().matrix();
    *grad += x.row(w).transpose() - x.transpose() * p;
  }
  return s[w] - lse;
}

}  // namespace turf

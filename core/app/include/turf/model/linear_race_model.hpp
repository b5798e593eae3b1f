#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/model/feature_standardizer.hpp"
#include "turf/model/i_race_model.hpp"

#include <Eigen/Dense>

#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// LinearRaceModel — shared scorer and optimiser of both model variants
// -----------------------------------------------------------------------------
//
// @brief  s_i = w . standardise(x_i); parameters fitted by minimising
//
//           L(w) = -(1/m) * sum_e loglik_e(w) + (l2_penalty / 2) * |w|^2
//
//         with full-batch gradient descent and Armijo backtracking.
//
// @details
// The standardiser is fitted on the training rows before the optimiser
// starts. Weights start at zero, so an unfitted or data-starved model
// predicts the uniform distribution.
//
// Subclasses supply the per-event likelihood and its gradient; everything
// else (scoring, normalisation, the optimiser) lives here.
//
// Stopping: |grad| < tol, or a relative change in L below tol, or
// max_iterations. The step halves until the Armijo condition holds; if it
// underflows the current weights are kept and the fit stops.
// -----------------------------------------------------------------------------
class LinearRaceModel : public IRaceModel {
 public:
  explicit LinearRaceModel(const domain::ModelConfig& config);

  FitSummary fit(const std::vector<EventFeatures>& training) override;
  Eigen::VectorXd score(const EventFeatures& event) const override;
  Prediction predict(const EventFeatures& event) const override;
  double eventLogLikelihood(const EventFeatures& event) const override;

  bool isFitted() const override { return fitted_; }
  const Eigen::VectorXd& weights() const override { return weights_; }
  const FeatureStandardizer& standardizer() const { return standardizer_; }
  const domain::ModelConfig& config() const { return config_; }

 protected:
  // Whether a settled event carries the labels this variant learns from.
  virtual bool usableForTraining(const EventFeatures& event) const = 0;

  // Log-likelihood of one event given standardised rows `x` and raw scores
  // `s = x * w`. When `grad` is non-null, adds d(loglik)/dw to it.
  virtual double logLikelihood(const Eigen::MatrixXd& x,
                               const Eigen::VectorXd& s,
                               const EventFeatures& event,
                               Eigen::VectorXd* grad) const = 0;

 private:
  double objective(const std::vector<Eigen::MatrixXd>& xs,
                   const std::vector<const EventFeatures*>& events,
                   const Eigen::VectorXd& w, Eigen::VectorXd* grad) const;

  domain::ModelConfig config_;
  FeatureStandardizer standardizer_;
  Eigen::VectorXd weights_;
  bool fitted_{false};
};

}  // namespace turf

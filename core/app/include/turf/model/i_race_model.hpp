#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/event.hpp"
#include "turf/features/feature_assembler.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace turf {

// Per-event output of a race model: one probability per entrant, in
// entrant order, summing to 1 within ModelConfig::probability_tolerance.
struct Prediction {
  domain::EventKey key;
  std::vector<domain::EntrantId> entrant_ids;
  Eigen::VectorXd probabilities;
  Eigen::VectorXd scores;
  bool numerical_fallback{false};
  std::string fallback_reason;
};

// Outcome of IRaceModel::fit.
struct FitSummary {
  std::size_t events_used{0};
  std::size_t events_excluded{0};
  std::size_t iterations{0};
  double final_loss{0.0};
  bool converged{false};
};

// -----------------------------------------------------------------------------
// IRaceModel — abstract interface for race-probability models
// -----------------------------------------------------------------------------
//
// @brief  Polymorphic base for every model that maps an event's feature
//         rows to a win-probability distribution over its entrants.
//
// @details
// The model never sees more than one event at a time when predicting:
// probabilities are normalised within the event, so a 5-runner race and a
// 20-runner race are handled by the same parameters.
//
// The evaluator and RaceEngine hold a std::unique_ptr<IRaceModel> built by
// makeRaceModel() so the winner-only softmax and the Plackett–Luce variant
// can be swapped by configuration alone.
//
// Thread model:
//   fit() mutates the model. predict()/score() are const and may be called
//   concurrently once fitting has finished.
// -----------------------------------------------------------------------------
class IRaceModel {
 public:
  virtual ~IRaceModel() = default;

  // Fits parameters to settled training events. Events the variant cannot
  // learn from (no winner, no finishers) are counted as excluded.
  virtual FitSummary fit(const std::vector<EventFeatures>& training) = 0;

  // Raw linear scores, one per entrant.
  virtual Eigen::VectorXd score(const EventFeatures& event) const = 0;

  // Normalised win probabilities. Falls back to uniform (and flags it) when
  // the numerical guards trip.
  virtual Prediction predict(const EventFeatures& event) const = 0;

  // Log-likelihood of a settled event's observed outcome under the model's
  // own training objective.
  virtual double eventLogLikelihood(const EventFeatures& event) const = 0;

  virtual domain::ModelVariant variant() const = 0;
  virtual bool isFitted() const = 0;
  virtual const Eigen::VectorXd& weights() const = 0;
};

}  // namespace turf

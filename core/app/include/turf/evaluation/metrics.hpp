#pragma once

#include "turf/model/i_race_model.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <vector>

namespace turf {

// Floor applied to the winner's probability before taking its log, so a
// confident miss costs a large but finite amount.
constexpr double kLogLossFloor = 1e-15;

// Negative log of the winner's probability.
double eventLogLoss(const Eigen::VectorXd& probabilities, std::size_t winner);

// Multi-class Brier score: sum_i (p_i - [i == winner])^2, in [0, 2].
double eventBrier(const Eigen::VectorXd& probabilities, std::size_t winner);

// One equal-width probability bin over all (entrant, event) pairs.
struct CalibrationBin {
  double lower{0.0};
  double upper{0.0};
  std::size_t count{0};
  double mean_predicted{0.0};
  double observed_rate{0.0};
};

struct MetricsSummary {
  std::size_t events{0};            // Scored events with a winner
  std::size_t events_without_winner{0};
  std::size_t entrants{0};
  double log_loss{0.0};             // Mean over events
  double brier{0.0};                // Mean over events
  std::vector<CalibrationBin> calibration;
};

// -----------------------------------------------------------------------------
// MetricsAccumulator
// -----------------------------------------------------------------------------
//
// @brief  Streams predictions in and produces log-loss, Brier and a
//         calibration table.
//
// @details
// Sums are kept rather than means so that per-fold accumulators can be
// merged into the aggregate exactly, in fold order, regardless of how many
// worker threads produced them.
//
// Events whose outcome has no winner (every runner a non-finisher) cannot
// be scored by log-loss or Brier; they are counted in
// events_without_winner and contribute nothing else.
//
// Thread model: plain value type, one per fold.
// -----------------------------------------------------------------------------
class MetricsAccumulator {
 public:
  explicit MetricsAccumulator(std::size_t calibration_bins);

  void add(const Prediction& prediction, std::optional<std::size_t> winner);
  void merge(const MetricsAccumulator& other);

  MetricsSummary summary() const;

 private:
  struct BinSums {
    std::size_t count{0};
    double predicted{0.0};
    double observed{0.0};
  };

  std::size_t binOf(double p) const;

  std::size_t events_{0};
  std::size_t events_without_winner_{0};
  std::size_t entrants_{0};
  double log_loss_sum_{0.0};
  double brier_sum_{0.0};
  std::vector<BinSums> bins_;
};

}  // namespace turf

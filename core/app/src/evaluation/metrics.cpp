#include "turf/evaluation/metrics.hpp"
#include "turf/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace turf {

namespace {

void checkWinner(const Eigen::VectorXd& probabilities, std::size_t winner) {
  if (winner >= static_cast<std::size_t>(probabilities.size())) {
    std::ostringstream os;
    os << "winner index " << winner << " outside a field of "
       << probabilities.size();
    throw DegenerateInputError(os.str());
  }
}

}  // namespace

double eventLogLoss(const Eigen::VectorXd& probabilities, std::size_t winner) {
  checkWinner(probabilities, winner);
  const double p = probabilities[static_cast<Eigen::Index>(winner)];
  return -std::log(std::max(p, kLogLossFloor));
}

double eventBrier(const Eigen::VectorXd& probabilities, std::size_t winner) {
  checkWinner(probabilities, winner);
  Eigen::VectorXd outcome = Eigen::VectorXd::Zero(probabilities.size());
  outcome[static_cast<Eigen::Index>(winner)] = 1.0;
  return (probabilities - outcome).squaredNorm();
}

MetricsAccumulator::MetricsAccumulator(std::size_t calibration_bins)
    : bins_(calibration_bins) {
  if (calibration_bins == 0) {
    throw ConfigError("calibration_bins must be positive");
  }
}

std::size_t MetricsAccumulator::binOf(double p) const {
  const auto k = static_cast<std::size_t>(p * static_cast<double>(bins_.size()));
  return std::min(k, bins_.size() - 1);
}

void MetricsAccumulator::add(const Prediction& prediction,
                             std::optional<std::size_t> winner) {
  if (!winner) {
    ++events_without_winner_;
    return;
  }

  ++events_;
  log_loss_sum_ += eventLogLoss(prediction.probabilities, *winner);
  brier_sum_ += eventBrier(prediction.probabilities, *winner);

  for (Eigen::Index i = 0; i < prediction.probabilities.size(); ++i) {
    const double p = std::clamp(prediction.probabilities[i], 0.0, 1.0);
    BinSums& bin = bins_[binOf(p)];
    ++bin.count;
    bin.predicted += p;
    bin.observed += static_cast<std::size_t>(i) == *winner ? 1.0 : 0.0;
    ++entrants_;
  }
}

void MetricsAccumulator::merge(const MetricsAccumulator& other) {
  if (other.bins_.size() != bins_.size()) {
    throw ConfigError("cannot merge metrics with different calibration bins");
  }
  events_ += other.events_;
  events_without_winner_ += other.events_without_winner_;
  entrants_ += other.entrants_;
  log_loss_sum_ += other.log_loss_sum_;
  brier_sum_ += other.brier_sum_;
  for (std::size_t b = 0; b < bins_.size(); ++b) {
    bins_[b].count += other.bins_[b].count;
    bins_[b].predicted += other.bins_[b].predicted;
    bins_[b].observed += other.bins_[b].observed;
  }
}

MetricsSummary MetricsAccumulator::summary() const {
  MetricsSummary out;
  out.events = events_;
  out.events_without_winner = events_without_winner_;
  out.entrants = entrants_;
  if (events_ > 0) {
    out.log_loss = log_loss_sum_ / static_cast<double>(events_);
    out.brier = brier_sum_ / static_cast<double>(events_);
  }

  const double width = 1.0 / static_cast<double>(bins_.size());
  out.calibration.reserve(bins_.size());
  for (std::size_t b = 0; b < bins_.size(); ++b) {
    CalibrationBin bin;
    bin.lower = static_cast<double>(b) * width;
    bin.upper = b + 1 == bins_.size() ? 1.0 : static_cast<double>(b + 1) * width;
    bin.count = bins_[b].count;
    if (bin.count > 0) {
      bin.mean_predicted = bins_[b].predicted / static_cast<double>(bin.count);
      bin.observed_rate = bins_[b].observed / static_cast<double>(bin.count);
    }
    out.calibration.push_back(bin);
  }
  return out;
}

}  // namespace turf

#include "turf/evaluation/fold_plan.hpp"
#include "turf/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <utility>

namespace turf {

const char* toString(FoldState state) {
  switch (state) {
    case FoldState::Idle:
      return "Idle";
    case FoldState::Training:
      return "Training";
    case FoldState::Scoring:
      return "Scoring";
    case FoldState::Aggregating:
      return "Aggregating";
    case FoldState::Complete:
      return "Complete";
    case FoldState::Skipped:
      return "Skipped";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// planFolds
// -----------------------------------------------------------------------------
std::vector<Fold> planFolds(const EventTimeline& timeline,
                            const domain::EvaluationConfig& config) {
  config.validate();

  std::vector<std::size_t> settled;
  settled.reserve(timeline.size());
  for (std::size_t i = 0; i < timeline.size(); ++i) {
    if (timeline.at(i).isSettled()) {
      settled.push_back(i);
    }
  }
  const std::size_t n = settled.size();
  auto ts = [&](std::size_t k) { return timeline.at(settled[k]).timestamp_ms; };

  std::size_t start = std::min(config.warmup_events, n);
  while (start > 0 && start < n && ts(start) == ts(start - 1)) {
    ++start;
  }

  std::vector<Fold> folds;
  while (start < n) {
    std::size_t end = std::min(start + config.test_window_events, n);
    while (end < n && ts(end) == ts(end - 1)) {
      ++end;
    }

    Fold fold;
    fold.index = folds.size();
    std::size_t train_begin = 0;
    if (config.max_train_events > 0 && start > config.max_train_events) {
      train_begin = start - config.max_train_events;
    }
    fold.train.assign(settled.begin() + static_cast<std::ptrdiff_t>(train_begin),
                      settled.begin() + static_cast<std::ptrdiff_t>(start));
    fold.test.assign(settled.begin() + static_cast<std::ptrdiff_t>(start),
                     settled.begin() + static_cast<std::ptrdiff_t>(end));
    folds.push_back(std::move(fold));
    start = end;
  }
  return folds;
}

// -----------------------------------------------------------------------------
// validateFold
// -----------------------------------------------------------------------------
void validateFold(const EventTimeline& timeline, const Fold& fold) {
  auto checkRange = [&](std::size_t i, const char* window) {
    if (i >= timeline.size()) {
      std::ostringstream os;
      os << "fold " << fold.index << " " << window << " index " << i
         << " is outside a timeline of " << timeline.size() << " events";
      throw DegenerateInputError(os.str());
    }
  };

  if (fold.test.empty()) {
    std::ostringstream os;
    os << "fold " << fold.index << " has an empty test window";
    throw DegenerateInputError(os.str());
  }

  const domain::Event* latest_train = nullptr;
  for (std::size_t i : fold.train) {
    checkRange(i, "train");
    const domain::Event& e = timeline.at(i);
    if (latest_train == nullptr || latest_train->timestamp_ms < e.timestamp_ms) {
      latest_train = &e;
    }
  }

  const domain::Event* earliest_test = nullptr;
  for (std::size_t i : fold.test) {
    checkRange(i, "test");
    const domain::Event& e = timeline.at(i);
    if (!e.isSettled()) {
      std::ostringstream os;
      os << "fold " << fold.index << " tests on unsettled "
         << domain::describe(e.key());
      throw DegenerateInputError(os.str());
    }
    if (earliest_test == nullptr || e.timestamp_ms < earliest_test->timestamp_ms) {
      earliest_test = &e;
    }
  }

  if (latest_train != nullptr &&
      latest_train->timestamp_ms >= earliest_test->timestamp_ms) {
    std::ostringstream os;
    os << "fold " << fold.index << " trains on "
       << domain::describe(latest_train->key())
       << " which is not strictly before its test window starting at "
       << domain::describe(earliest_test->key());
    throw LeakageError(os.str());
  }
}

domain::TimestampMs foldBoundary(const EventTimeline& timeline,
                                 const Fold& fold) {
  if (fold.test.empty()) {
    std::ostringstream os;
    os << "fold " << fold.index << " has an empty test window";
    throw DegenerateInputError(os.str());
  }
  domain::TimestampMs boundary = timeline.at(fold.test.front()).timestamp_ms;
  for (std::size_t i : fold.test) {
    boundary = std::min(boundary, timeline.at(i).timestamp_ms);
  }
  return boundary;
}

}  // namespace turf

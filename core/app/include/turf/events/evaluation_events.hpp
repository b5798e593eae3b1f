#pragma once

#include "turf/domain/event.hpp"
#include "turf/evaluation/fold_plan.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace turf {

// Wall-clock time at which a notification was published. Distinct from
// domain::TimestampMs, which is race time.
using WallTime = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// FoldStateEvent — a fold moved from one lifecycle state to the next
// -----------------------------------------------------------------------------
// Published by ForwardChainingEvaluator on whichever worker thread runs the
// fold. Consumers must not assume folds progress in index order when
// worker_threads > 1.
// -----------------------------------------------------------------------------
struct FoldStateEvent {
  std::size_t fold_index{0};
  FoldState from{FoldState::Idle};
  FoldState to{FoldState::Idle};
  WallTime wall_time{};
};

// -----------------------------------------------------------------------------
// FoldSkippedEvent
// -----------------------------------------------------------------------------
// A fold could not be trained (empty train window). The run continues.
// -----------------------------------------------------------------------------
struct FoldSkippedEvent {
  std::size_t fold_index{0};
  std::string reason;
  domain::TimestampMs test_start_ms{0};
  WallTime wall_time{};
};

// -----------------------------------------------------------------------------
// NumericalIncidentEvent
// -----------------------------------------------------------------------------
// A prediction tripped a numerical guard and fell back to the uniform
// distribution. fold_index is empty for forecasts outside a backtest.
// -----------------------------------------------------------------------------
struct NumericalIncidentEvent {
  std::optional<std::size_t> fold_index;
  domain::EventId event_id{0};
  std::string reason;
  WallTime wall_time{};
};

// Summary of one sequential rating replay.
struct RatingPassEvent {
  std::optional<std::size_t> fold_index;
  std::size_t events_applied{0};
  std::size_t pending_skipped{0};
  std::size_t snapshots_appended{0};
  bool cancelled{false};
  WallTime wall_time{};
};

}  // namespace turf

#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/event.hpp"
#include "turf/timeline/event_timeline.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// FoldState — lifecycle of one fold inside the evaluator
// -----------------------------------------------------------------------------
//
//   Idle ──► Training ──► Scoring ──► Aggregating ──► Complete
//     │
//     └────► Skipped   (empty training window)
//
// Training covers the rating replay over the train window, feature
// assembly and model fitting. Scoring predicts every test event against
// ratings frozen at the fold boundary. A fatal error in any state aborts
// the whole run; there is no Failed state.
// -----------------------------------------------------------------------------
enum class FoldState : std::uint8_t {
  Idle,
  Training,
  Scoring,
  Aggregating,
  Complete,
  Skipped
};

const char* toString(FoldState state);

// -----------------------------------------------------------------------------
// Fold
// -----------------------------------------------------------------------------
// Train and test windows as indices into an EventTimeline, each in timeline
// order. Every train event must be strictly earlier than every test event.
// -----------------------------------------------------------------------------
struct Fold {
  std::size_t index{0};
  std::vector<std::size_t> train;
  std::vector<std::size_t> test;
};

// -------------------------------------------------------------------------
// planFolds(timeline, config)
// -------------------------------------------------------------------------
// @brief  Forward-chaining split of the timeline's settled events.
//
// @details
// The first `warmup_events` settled events are never tested. The rest are
// cut into consecutive test windows of `test_window_events`; a window is
// extended while the next event shares its last timestamp, and the warm-up
// cut is moved forward the same way, so no timestamp is split across a
// boundary. Each fold trains on all settled events before its test window
// (only the latest `max_train_events` when that is non-zero).
//
// Pending events are neither trained on nor tested. With warm-up 0 the
// first fold has an empty train window; the evaluator records it as
// skipped.
// -------------------------------------------------------------------------
std::vector<Fold> planFolds(const EventTimeline& timeline,
                            const domain::EvaluationConfig& config);

// -------------------------------------------------------------------------
// validateFold(timeline, fold)
// -------------------------------------------------------------------------
// Structural and temporal checks for one fold, hand-built or planned:
//   - indices in range, test window non-empty   → DegenerateInputError
//   - test events settled                        → DegenerateInputError
//   - max(train timestamp) < min(test timestamp) → LeakageError otherwise
// -------------------------------------------------------------------------
void validateFold(const EventTimeline& timeline, const Fold& fold);

// Start of the fold's test window: the earliest test timestamp.
domain::TimestampMs foldBoundary(const EventTimeline& timeline,
                                 const Fold& fold);

}  // namespace turf

#pragma once

#include "turf/domain/engine_config.hpp"
#include "turf/domain/event.hpp"
#include "turf/domain/rating_snapshot.hpp"
#include "turf/evaluation/forward_chaining_evaluator.hpp"
#include "turf/model/i_race_model.hpp"
#include "turf/timeline/event_timeline.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace turf {
namespace io {

// -----------------------------------------------------------------------------
// JSON boundary
// -----------------------------------------------------------------------------
//
// @brief  Converts configuration and race records from JSON, and results
//         back to JSON.
//
// @details
// Input errors never escape as nlohmann exceptions:
//   configuration  → ConfigError
//   race records   → DegenerateInputError
// Both name the offending field (and event id where one is known).
//
// Configuration layout (every field optional except
// rating.non_finisher_policy):
//
//   {
//     "rating": {
//       "alpha": 0.3, "agent_alpha": 0.3, "default_rating": 0.5,
//       "cold_start": "fixed" | "population_mean",
//       "single_runner_performance": 1.0,
//       "non_finisher_policy": { "mode": "fixed", "value": 0.0 }
//                            | { "mode": "below_last_finisher" },
//       "agent_prior_strength": 10, "partition_by_stratum": false,
//       "rate_agents": true
//     },
//     "model": {
//       "variant": "softmax" | "plackett_luce", "l2_penalty": 0.001,
//       "max_iterations": 500, "convergence_tolerance": 1e-10,
//       "initial_step": 1.0, "seed": 0, "probability_tolerance": 1e-9
//     },
//     "evaluation": {
//       "warmup_events": 0, "test_window_events": 100,
//       "max_train_events": 0, "calibration_bins": 10, "worker_threads": 1
//     }
//   }
//
// Timeline layout: either an array of events or { "events": [...] }.
//
//   {
//     "event_id": 7, "timestamp_ms": 1700000000000, "stratum": "flat",
//     "racecourse": "York", "distance": 1600, "n_runners": 2,
//     "status": "settled" | "pending",
//     "entrants": [
//       { "entrant_id": 1, "competitor_id": 11, "jockey_id": 21,
//         "trainer_id": 31, "age": 4, "weight_lbs": 126, "draw": 3,
//         "market_price": 3.5, "finish_position": 1, "non_finisher": false }
//     ]
//   }
//
// n_runners defaults to the number of entrants; status defaults to
// "settled" when any entrant carries an outcome, otherwise "pending".
// -----------------------------------------------------------------------------

domain::EngineConfig parseEngineConfig(const nlohmann::json& j);
domain::EngineConfig loadEngineConfig(const std::string& path);
nlohmann::json engineConfigToJson(const domain::EngineConfig& config);

domain::Event parseEvent(const nlohmann::json& j);
EventTimeline parseTimeline(const nlohmann::json& j);
EventTimeline loadTimeline(const std::string& path);

nlohmann::json predictionsToJson(const std::vector<PredictionRow>& rows);
nlohmann::json forecastToJson(const std::vector<Prediction>& predictions);
nlohmann::json reportToJson(const EvaluationReport& report);
nlohmann::json ratingRowsToJson(const std::vector<domain::RatingRow>& rows);

// Writes `j` pretty-printed. Throws TurfError when the file cannot be
// written.
void writeJson(const nlohmann::json& j, const std::string& path);

}  // namespace io
}  // namespace turf

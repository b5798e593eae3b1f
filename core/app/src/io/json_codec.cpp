#include "turf/io/json_codec.hpp"
#include "turf/errors.hpp"
#include "turf/evaluation/fold_plan.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace turf {
namespace io {

using nlohmann::json;

namespace {

template <typename T>
T fieldOr(const json& obj, const char* key, T fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

template <typename T>
std::optional<T> optionalField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::size_t countOr(const json& obj, const char* key, std::size_t fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw ConfigError(std::string(key) + " must be a non-negative integer");
  }
  return it->get<std::size_t>();
}

json parseFile(const std::string& path, bool config) {
  std::ifstream in(path);
  if (!in) {
    const std::string msg = "cannot open " + path;
    if (config) {
      throw ConfigError(msg);
    }
    throw DegenerateInputError(msg);
  }
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    const std::string msg = path + ": " + e.what();
    if (config) {
      throw ConfigError(msg);
    }
    throw DegenerateInputError(msg);
  }
}

json optionalToJson(const std::optional<double>& v) {
  return v ? json(*v) : json(nullptr);
}

// -----------------------------------------------------------------------------
// Config sections
// -----------------------------------------------------------------------------
domain::RatingConfig parseRating(const json& j) {
  domain::RatingConfig c;
  c.alpha = fieldOr(j, "alpha", c.alpha);
  c.agent_alpha = fieldOr(j, "agent_alpha", c.agent_alpha);
  c.default_rating = fieldOr(j, "default_rating", c.default_rating);
  c.single_runner_performance =
      fieldOr(j, "single_runner_performance", c.single_runner_performance);
  c.agent_prior_strength =
      fieldOr(j, "agent_prior_strength", c.agent_prior_strength);
  c.partition_by_stratum =
      fieldOr(j, "partition_by_stratum", c.partition_by_stratum);
  c.rate_agents = fieldOr(j, "rate_agents", c.rate_agents);

  const std::string cold = fieldOr<std::string>(j, "cold_start", "fixed");
  if (cold == "fixed") {
    c.cold_start = domain::ColdStartMode::Fixed;
  } else if (cold == "population_mean") {
    c.cold_start = domain::ColdStartMode::PopulationMean;
  } else {
    throw ConfigError("rating.cold_start must be \"fixed\" or "
                      "\"population_mean\", got \"" + cold + "\"");
  }

  auto policy = j.find("non_finisher_policy");
  if (policy == j.end() || policy->is_null()) {
    throw ConfigError(
        "rating.non_finisher_policy is required (\"fixed\" with a value, or "
        "\"below_last_finisher\")");
  }
  domain::NonFinisherPolicy p;
  const std::string mode = policy->at("mode").get<std::string>();
  if (mode == "fixed") {
    p.mode = domain::NonFinisherMode::Fixed;
    p.value = policy->at("value").get<double>();
  } else if (mode == "below_last_finisher") {
    p.mode = domain::NonFinisherMode::BelowLastFinisher;
  } else {
    throw ConfigError("rating.non_finisher_policy.mode must be \"fixed\" or "
                      "\"below_last_finisher\", got \"" + mode + "\"");
  }
  c.non_finisher_policy = p;
  return c;
}

domain::ModelConfig parseModel(const json& j) {
  domain::ModelConfig c;
  const std::string variant = fieldOr<std::string>(j, "variant", "softmax");
  if (variant == "softmax") {
    c.variant = domain::ModelVariant::Softmax;
  } else if (variant == "plackett_luce") {
    c.variant = domain::ModelVariant::PlackettLuce;
  } else {
    throw ConfigError("model.variant must be \"softmax\" or "
                      "\"plackett_luce\", got \"" + variant + "\"");
  }
  c.l2_penalty = fieldOr(j, "l2_penalty", c.l2_penalty);
  c.max_iterations = countOr(j, "max_iterations", c.max_iterations);
  c.convergence_tolerance =
      fieldOr(j, "convergence_tolerance", c.convergence_tolerance);
  c.initial_step = fieldOr(j, "initial_step", c.initial_step);
  c.seed = fieldOr(j, "seed", c.seed);
  c.probability_tolerance =
      fieldOr(j, "probability_tolerance", c.probability_tolerance);
  return c;
}

domain::EvaluationConfig parseEvaluation(const json& j) {
  domain::EvaluationConfig c;
  c.warmup_events = countOr(j, "warmup_events", c.warmup_events);
  c.test_window_events = countOr(j, "test_window_events", c.test_window_events);
  c.max_train_events = countOr(j, "max_train_events", c.max_train_events);
  c.calibration_bins = countOr(j, "calibration_bins", c.calibration_bins);
  c.worker_threads = countOr(j, "worker_threads", c.worker_threads);
  return c;
}

const char* variantName(domain::ModelVariant v) {
  return v == domain::ModelVariant::Softmax ? "softmax" : "plackett_luce";
}

json metricsToJson(const MetricsSummary& m) {
  json bins = json::array();
  for (const auto& b : m.calibration) {
    bins.push_back({{"lower", b.lower},
                    {"upper", b.upper},
                    {"count", b.count},
                    {"mean_predicted", b.mean_predicted},
                    {"observed_rate", b.observed_rate}});
  }
  return {{"events", m.events},
          {"events_without_winner", m.events_without_winner},
          {"entrants", m.entrants},
          {"log_loss", m.log_loss},
          {"brier", m.brier},
          {"calibration", bins}};
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
domain::EngineConfig parseEngineConfig(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }
  domain::EngineConfig config;
  try {
    auto rating = j.find("rating");
    if (rating == j.end()) {
      throw ConfigError(
          "missing \"rating\" section (rating.non_finisher_policy is "
          "required)");
    }
    config.rating = parseRating(*rating);
    if (auto model = j.find("model"); model != j.end()) {
      config.model = parseModel(*model);
    }
    if (auto eval = j.find("evaluation"); eval != j.end()) {
      config.evaluation = parseEvaluation(*eval);
    }
  } catch (const json::exception& e) {
    throw ConfigError(e.what());
  }
  config.validate();
  return config;
}

domain::EngineConfig loadEngineConfig(const std::string& path) {
  return parseEngineConfig(parseFile(path, true));
}

json engineConfigToJson(const domain::EngineConfig& config) {
  const auto& r = config.rating;
  json policy = nullptr;
  if (r.non_finisher_policy) {
    if (r.non_finisher_policy->mode == domain::NonFinisherMode::Fixed) {
      policy = {{"mode", "fixed"}, {"value", r.non_finisher_policy->value}};
    } else {
      policy = {{"mode", "below_last_finisher"}};
    }
  }
  const auto& m = config.model;
  const auto& e = config.evaluation;
  return {
      {"rating",
       {{"alpha", r.alpha},
        {"agent_alpha", r.agent_alpha},
        {"default_rating", r.default_rating},
        {"cold_start", r.cold_start == domain::ColdStartMode::Fixed
                           ? "fixed"
                           : "population_mean"},
        {"single_runner_performance", r.single_runner_performance},
        {"non_finisher_policy", policy},
        {"agent_prior_strength", r.agent_prior_strength},
        {"partition_by_stratum", r.partition_by_stratum},
        {"rate_agents", r.rate_agents}}},
      {"model",
       {{"variant", variantName(m.variant)},
        {"l2_penalty", m.l2_penalty},
        {"max_iterations", m.max_iterations},
        {"convergence_tolerance", m.convergence_tolerance},
        {"initial_step", m.initial_step},
        {"seed", m.seed},
        {"probability_tolerance", m.probability_tolerance}}},
      {"evaluation",
       {{"warmup_events", e.warmup_events},
        {"test_window_events", e.test_window_events},
        {"max_train_events", e.max_train_events},
        {"calibration_bins", e.calibration_bins},
        {"worker_threads", e.worker_threads}}}};
}

// -----------------------------------------------------------------------------
// parseEvent
// -----------------------------------------------------------------------------
domain::Event parseEvent(const json& j) {
  domain::Event event;
  try {
    event.event_id = j.at("event_id").get<domain::EventId>();
    event.timestamp_ms = j.at("timestamp_ms").get<domain::TimestampMs>();
    event.stratum = fieldOr<std::string>(j, "stratum", "");
    event.racecourse = fieldOr<std::string>(j, "racecourse", "");
    event.distance = optionalField<double>(j, "distance");

    bool any_outcome = false;
    for (const auto& e : j.at("entrants")) {
      domain::Entrant entrant;
      entrant.entrant_id = e.at("entrant_id").get<domain::EntrantId>();
      entrant.competitor_id = e.at("competitor_id").get<domain::EntityId>();
      if (auto jockey = optionalField<domain::EntityId>(e, "jockey_id")) {
        entrant.agents.push_back({domain::EntityKind::Jockey, *jockey});
      }
      if (auto trainer = optionalField<domain::EntityId>(e, "trainer_id")) {
        entrant.agents.push_back({domain::EntityKind::Trainer, *trainer});
      }
      entrant.attributes.age = optionalField<double>(e, "age");
      entrant.attributes.weight_lbs = optionalField<double>(e, "weight_lbs");
      entrant.attributes.draw = optionalField<double>(e, "draw");
      entrant.market_price = optionalField<double>(e, "market_price");
      entrant.outcome.finish_position = optionalField<int>(e, "finish_position");
      entrant.outcome.non_finisher = fieldOr(e, "non_finisher", false);
      any_outcome = any_outcome || entrant.outcome.finished() ||
                    entrant.outcome.non_finisher;
      event.entrants.push_back(std::move(entrant));
    }

    event.n_runners = fieldOr<std::size_t>(j, "n_runners", event.entrants.size());
    const std::string status =
        fieldOr<std::string>(j, "status", any_outcome ? "settled" : "pending");
    if (status == "settled") {
      event.status = domain::OutcomeStatus::Settled;
    } else if (status == "pending") {
      event.status = domain::OutcomeStatus::Pending;
    } else {
      std::ostringstream os;
      os << "event#" << event.event_id << " has unknown status \"" << status
         << "\"";
      throw DegenerateInputError(os.str());
    }
  } catch (const json::exception& e) {
    std::ostringstream os;
    os << "malformed event record";
    if (event.event_id != 0) {
      os << " event#" << event.event_id;
    }
    os << ": " << e.what();
    throw DegenerateInputError(os.str());
  }
  event.validate();
  return event;
}

EventTimeline parseTimeline(const json& j) {
  const json* events = &j;
  if (j.is_object()) {
    auto it = j.find("events");
    if (it == j.end()) {
      throw DegenerateInputError("timeline object has no \"events\" array");
    }
    events = &*it;
  }
  if (!events->is_array()) {
    throw DegenerateInputError("timeline events must be a JSON array");
  }

  std::vector<domain::Event> parsed;
  parsed.reserve(events->size());
  for (const auto& e : *events) {
    parsed.push_back(parseEvent(e));
  }
  return EventTimeline(std::move(parsed));
}

EventTimeline loadTimeline(const std::string& path) {
  return parseTimeline(parseFile(path, false));
}

// -----------------------------------------------------------------------------
// Output
// -----------------------------------------------------------------------------
json predictionsToJson(const std::vector<PredictionRow>& rows) {
  json out = json::array();
  for (const auto& r : rows) {
    out.push_back({{"fold", r.fold_index},
                   {"event_id", r.event_id},
                   {"timestamp_ms", r.timestamp_ms},
                   {"entrant_id", r.entrant_id},
                   {"probability", r.probability},
                   {"score", r.score},
                   {"market_price", optionalToJson(r.market_price)},
                   {"won", r.won},
                   {"numerical_fallback", r.numerical_fallback}});
  }
  return out;
}

json forecastToJson(const std::vector<Prediction>& predictions) {
  json out = json::array();
  for (const auto& p : predictions) {
    json entrants = json::array();
    for (std::size_t k = 0; k < p.entrant_ids.size(); ++k) {
      const auto r = static_cast<Eigen::Index>(k);
      entrants.push_back({{"entrant_id", p.entrant_ids[k]},
                          {"probability", p.probabilities[r]},
                          {"score", p.scores[r]}});
    }
    out.push_back({{"event_id", p.key.event_id},
                   {"timestamp_ms", p.key.timestamp_ms},
                   {"numerical_fallback", p.numerical_fallback},
                   {"fallback_reason", p.fallback_reason},
                   {"entrants", entrants}});
  }
  return out;
}

json reportToJson(const EvaluationReport& report) {
  json folds = json::array();
  for (const auto& f : report.folds) {
    json fold = {{"index", f.index},
                 {"state", toString(f.state)},
                 {"train_events", f.train_events},
                 {"test_events", f.test_events},
                 {"test_start_ms", f.test_start_ms},
                 {"test_end_ms", f.test_end_ms},
                 {"numerical_incidents", f.numerical_incidents}};
    fold["train_end_ms"] =
        f.train_end_ms ? json(*f.train_end_ms) : json(nullptr);
    if (f.state == FoldState::Skipped) {
      fold["skip_reason"] = f.skip_reason;
    } else {
      fold["rating_pass"] = {{"events_applied", f.rating_pass.events_applied},
                             {"snapshots_appended",
                              f.rating_pass.snapshots_appended}};
      fold["fit"] = {{"events_used", f.fit.events_used},
                     {"events_excluded", f.fit.events_excluded},
                     {"iterations", f.fit.iterations},
                     {"final_loss", f.fit.final_loss},
                     {"converged", f.fit.converged}};
      fold["metrics"] = metricsToJson(f.metrics);
    }
    folds.push_back(std::move(fold));
  }

  return {{"variant", variantName(report.variant)},
          {"seed", report.seed},
          {"folds_planned", report.folds_planned},
          {"skipped_folds", report.skipped_folds},
          {"numerical_incidents", report.numerical_incidents},
          {"cancelled", report.cancelled},
          {"aggregate", metricsToJson(report.aggregate)},
          {"folds", folds},
          {"predictions", predictionsToJson(report.predictions)}};
}

json ratingRowsToJson(const std::vector<domain::RatingRow>& rows) {
  json out = json::array();
  for (const auto& r : rows) {
    out.push_back({{"kind", domain::toString(r.entity.kind)},
                   {"id", r.entity.id},
                   {"stratum", r.entity.stratum},
                   {"timestamp_ms", r.timestamp_ms},
                   {"event_id", r.event_id},
                   {"rating", r.rating}});
  }
  return out;
}

void writeJson(const json& j, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw TurfError("cannot open " + path + " for writing");
  }
  out << j.dump(2) << "\n";
  if (!out) {
    throw TurfError("failed writing " + path);
  }
}

}  // namespace io
}  // namespace turf

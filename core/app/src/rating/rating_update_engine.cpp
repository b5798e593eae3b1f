#include "turf/rating/rating_update_engine.hpp"
#include "turf/errors.hpp"
#include "turf/timeline/event_timeline.hpp"

#include <map>
#include <sstream>
#include <utility>

namespace turf {

RatingUpdateEngine::RatingUpdateEngine(const domain::RatingConfig& config)
    : config_(config),
      competitor_(UpdateStrategy::exponentialDecay(config, config.alpha)),
      agent_(UpdateStrategy::shrinkageToMean(config, config.agent_alpha,
                                             config.agent_prior_strength)) {}

domain::EntityKey RatingUpdateEngine::keyFor(domain::EntityKind kind,
                                             domain::EntityId id,
                                             const domain::Event& event) const {
  domain::EntityKey key;
  key.kind = kind;
  key.id = id;
  if (config_.partition_by_stratum) {
    key.stratum = event.stratum;
  }
  return key;
}

double RatingUpdateEngine::coldStartRating(
    const RatingStore& store, domain::EntityKind kind,
    const std::string& stratum, domain::TimestampMs t,
    std::optional<domain::TimestampMs>* population_timestamp_ms) const {
  if (config_.cold_start == domain::ColdStartMode::PopulationMean) {
    if (auto population = store.populationMeanBefore(kind, stratum, t)) {
      if (population_timestamp_ms != nullptr) {
        *population_timestamp_ms = population->timestamp_ms;
      }
      return population->mean;
    }
  }
  return config_.default_rating;
}

// -----------------------------------------------------------------------------
// update: stage every entity's new snapshot, then commit once
// -----------------------------------------------------------------------------
std::size_t RatingUpdateEngine::update(RatingStore& store,
                                       const domain::Event& event) const {
  const domain::EventKey key = event.key();

  if (!event.isSettled()) {
    throw DegenerateInputError("rating update requires a settled outcome: " +
                               domain::describe(key));
  }
  if (auto mark = store.watermark(); mark && !(*mark < key)) {
    std::ostringstream os;
    os << domain::describe(key) << " presented after "
       << domain::describe(*mark) << " was already folded in";
    throw OrderingError(os.str());
  }

  const domain::TimestampMs t = key.timestamp_ms;
  const std::string stratum = config_.partition_by_stratum ? event.stratum : "";
  std::vector<StagedSnapshot> staged;
  staged.reserve(event.entrants.size() * 3);

  // Builds the staged snapshot for one entity from its prior state.
  auto stage = [&](const domain::EntityKey& entity,
                   const UpdateStrategy& strategy, double score) {
    PriorRating prior;
    const auto last = store.latest(entity);
    if (last && !(last->key() < key)) {
      std::ostringstream os;
      os << domain::describe(entity) << " already rated at t="
         << last->timestamp_ms << "ms (event#" << last->event_id
         << "), not before " << domain::describe(key);
      throw OrderingError(os.str());
    }
    if (last) {
      prior.raw_rating = last->raw_rating;
      prior.observations = last->observations;
    } else {
      prior.raw_rating = coldStartRating(store, entity.kind, stratum, t);
    }

    double target = config_.default_rating;
    if (strategy.rule() == UpdateRule::ShrinkageToMean) {
      if (auto population =
              store.populationMeanBefore(entity.kind, stratum, t)) {
        target = population->mean;
      }
    }

    const UpdatedRating next = strategy.update(prior, score, target);

    StagedSnapshot s;
    s.entity = entity;
    s.snapshot.timestamp_ms = t;
    s.snapshot.event_id = key.event_id;
    s.snapshot.rating = next.rating;
    s.snapshot.raw_rating = next.raw_rating;
    s.snapshot.observations = next.observations;
    s.performance = score;
    staged.push_back(s);
  };

  // Agent observations are averaged per entity before staging. std::map
  // keeps the staging order deterministic.
  std::map<domain::EntityKey, std::pair<double, std::size_t>> agent_scores;

  for (const auto& entrant : event.entrants) {
    const double perf = competitor_.performance(event, entrant);
    stage(keyFor(domain::EntityKind::Competitor, entrant.competitor_id, event),
          competitor_, perf);

    if (!config_.rate_agents) {
      continue;
    }
    for (const auto& ref : entrant.agents) {
      auto& acc = agent_scores[keyFor(ref.kind, ref.id, event)];
      acc.first += perf;
      acc.second += 1;
    }
  }

  for (const auto& [entity, acc] : agent_scores) {
    stage(entity, agent_, acc.first / static_cast<double>(acc.second));
  }

  store.commit(key, staged);
  return staged.size();
}

// -----------------------------------------------------------------------------
// replay: the sequential pass
// -----------------------------------------------------------------------------
RatingPassStats RatingUpdateEngine::replay(
    RatingStore& store, const std::vector<const domain::Event*>& events,
    const std::atomic<bool>* cancel) const {
  RatingPassStats stats;
  for (const domain::Event* event : events) {
    if (cancel != nullptr && cancel->load()) {
      stats.cancelled = true;
      break;
    }
    if (!event->isSettled()) {
      ++stats.pending_skipped;
      continue;
    }
    stats.snapshots_appended += update(store, *event);
    ++stats.events_applied;
  }
  return stats;
}

RatingPassStats RatingUpdateEngine::replay(RatingStore& store,
                                           const EventTimeline& timeline,
                                           const std::atomic<bool>* cancel) const {
  std::vector<const domain::Event*> events;
  events.reserve(timeline.size());
  for (const auto& e : timeline.events()) {
    events.push_back(&e);
  }
  return replay(store, events, cancel);
}

}  // namespace turf

#include "turf/features/feature_assembler.hpp"
#include "turf/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace turf {

const std::array<const char*, kFeatureCount>& featureNames() {
  static const std::array<const char*, kFeatureCount> names = {
      "competitor_rating", "competitor_has_history", "competitor_log_runs",
      "jockey_rating",     "trainer_rating",         "age",
      "weight_lbs",        "draw",
  };
  return names;
}

namespace {

double valueOrNaN(const std::optional<double>& v) {
  return v ? *v : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace

FeatureAssembler::FeatureAssembler(const RatingStore& store,
                                   const RatingUpdateEngine& engine)
    : store_(store), engine_(engine) {}

// -----------------------------------------------------------------------------
// ratingAsOf: point-in-time lookup with the cold start as the documented
// default
// -----------------------------------------------------------------------------
double FeatureAssembler::ratingAsOf(const domain::EntityKey& entity,
                                    domain::TimestampMs t,
                                    FeatureSource& source,
                                    std::uint32_t* observations) const {
  source.entity = entity;
  if (auto snap = store_.ratingBefore(entity, t)) {
    source.snapshot_timestamp_ms = snap->timestamp_ms;
    source.snapshot_event_id = snap->event_id;
    if (observations != nullptr) {
      *observations = snap->observations;
    }
    return snap->rating;
  }
  if (observations != nullptr) {
    *observations = 0;
  }
  return engine_.coldStartRating(store_, entity.kind, entity.stratum, t,
                                 &source.population_timestamp_ms);
}

// -----------------------------------------------------------------------------
// assemble
// -----------------------------------------------------------------------------
EventFeatures FeatureAssembler::assemble(const domain::Event& event) const {
  const domain::TimestampMs t = event.timestamp_ms;

  EventFeatures out;
  out.key = event.key();
  out.settled = event.isSettled();
  out.rows.reserve(event.entrants.size());
  out.market_prices.reserve(event.entrants.size());

  for (const auto& entrant : event.entrants) {
    FeatureRow row;
    row.entrant_id = entrant.entrant_id;
    row.values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(kFeatureCount));

    FeatureSource competitor_source;
    std::uint32_t runs = 0;
    row.values[kCompetitorRating] = ratingAsOf(
        engine_.keyFor(domain::EntityKind::Competitor, entrant.competitor_id,
                       event),
        t, competitor_source, &runs);
    row.values[kCompetitorHasHistory] = runs > 0 ? 1.0 : 0.0;
    row.values[kCompetitorLogRuns] = std::log1p(static_cast<double>(runs));
    row.sources.push_back(competitor_source);

    const std::string stratum =
        engine_.config().partition_by_stratum ? event.stratum : "";
    auto agentFeature = [&](domain::EntityKind kind) {
      auto id = entrant.agent(kind);
      FeatureSource source;
      double value = 0.0;
      if (!id || !engine_.config().rate_agents) {
        source.entity = domain::EntityKey{kind, 0, stratum};
        value = engine_.coldStartRating(store_, kind, stratum, t,
                                        &source.population_timestamp_ms);
      } else {
        value = ratingAsOf(engine_.keyFor(kind, *id, event), t, source, nullptr);
      }
      row.sources.push_back(source);
      return value;
    };
    row.values[kJockeyRating] = agentFeature(domain::EntityKind::Jockey);
    row.values[kTrainerRating] = agentFeature(domain::EntityKind::Trainer);

    row.values[kAge] = valueOrNaN(entrant.attributes.age);
    row.values[kWeightLbs] = valueOrNaN(entrant.attributes.weight_lbs);
    row.values[kDraw] = valueOrNaN(entrant.attributes.draw);

    out.rows.push_back(std::move(row));
    out.market_prices.push_back(entrant.market_price);
  }

  if (out.settled) {
    out.winner = event.winnerIndex();
    out.finishing_order = event.finishingOrder();
  }
  return out;
}

// -----------------------------------------------------------------------------
// verifyNoLeak
// -----------------------------------------------------------------------------
void FeatureAssembler::verifyNoLeak(
    const EventFeatures& features,
    std::optional<domain::TimestampMs> boundary_ms) {
  const domain::TimestampMs t = features.key.timestamp_ms;

  for (const auto& row : features.rows) {
    for (const auto& source : row.sources) {
      auto check = [&](std::optional<domain::TimestampMs> stamp,
                       std::optional<domain::EventId> event_id,
                       const char* what) {
        if (!stamp) {
          return;
        }
        const domain::TimestampMs used = *stamp;
        const bool after_event = used >= t;
        const bool after_boundary = boundary_ms && used >= *boundary_ms;
        if (!after_event && !after_boundary) {
          return;
        }
        std::ostringstream os;
        os << domain::describe(features.key) << " entrant "
           << row.entrant_id << " consumed " << domain::describe(source.entity)
           << " " << what;
        if (event_id) {
          os << " from event#" << *event_id;
        }
        os << " at t=" << used << "ms";
        if (after_boundary) {
          os << ", not before the fold boundary t=" << *boundary_ms << "ms";
        } else {
          os << ", not before the event itself";
        }
        throw LeakageError(os.str());
      };
      check(source.snapshot_timestamp_ms, source.snapshot_event_id,
            "snapshot");
      check(source.population_timestamp_ms, std::nullopt, "population mean");
    }
  }
}

}  // namespace turf

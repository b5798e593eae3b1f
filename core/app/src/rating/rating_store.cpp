#include "turf/rating/rating_store.hpp"
#include "turf/errors.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <set>
#include <sstream>

namespace turf {

// -----------------------------------------------------------------------------
// commit: validate → reserve → append
// -----------------------------------------------------------------------------
void RatingStore::commit(const domain::EventKey& event_key,
                         const std::vector<StagedSnapshot>& staged) {
  std::unique_lock lock(mutex_);

  // --- 1) Validate ordering and staging, touching nothing ---------------------
  if (watermark_ && !(*watermark_ < event_key)) {
    std::ostringstream os;
    os << "cannot commit " << domain::describe(event_key)
       << ": store already folded in " << domain::describe(*watermark_);
    throw OrderingError(os.str());
  }

  std::set<domain::EntityKey> seen;
  std::map<PopulationKey, std::pair<double, std::size_t>> population_delta;

  for (const auto& s : staged) {
    if (s.snapshot.key() != event_key) {
      throw DegenerateInputError(
          "snapshot for " + domain::describe(s.entity) + " is stamped " +
          domain::describe(s.snapshot.key()) + " but committed under " +
          domain::describe(event_key));
    }
    if (!seen.insert(s.entity).second) {
      throw DegenerateInputError(domain::describe(s.entity) +
                                 " staged twice for " +
                                 domain::describe(event_key));
    }

    auto it = histories_.find(s.entity);
    if (it != histories_.end() && !it->second.empty() &&
        it->second.back().timestamp_ms > event_key.timestamp_ms) {
      std::ostringstream os;
      os << domain::describe(s.entity) << " last updated at t="
         << it->second.back().timestamp_ms << "ms by event#"
         << it->second.back().event_id << ", later than "
         << domain::describe(event_key);
      throw OrderingError(os.str());
    }

    auto& delta = population_delta[{s.entity.kind, s.entity.stratum}];
    delta.first += s.performance;
    delta.second += 1;
  }

  // --- 2) Reserve so the appends below cannot throw ---------------------------
  for (const auto& s : staged) {
    auto& history = histories_[s.entity];
    history.reserve(history.size() + 1);
  }
  for (const auto& [key, delta] : population_delta) {
    auto& series = population_[key];
    series.reserve(series.size() + 1);
  }

  // --- 3) Append (no-throw) ----------------------------------------------------
  for (const auto& s : staged) {
    histories_[s.entity].push_back(s.snapshot);
  }
  for (const auto& [key, delta] : population_delta) {
    auto& series = population_[key];
    PopulationPoint point;
    point.timestamp_ms = event_key.timestamp_ms;
    point.cumulative_sum =
        (series.empty() ? 0.0 : series.back().cumulative_sum) + delta.first;
    point.cumulative_count =
        (series.empty() ? 0 : series.back().cumulative_count) + delta.second;
    series.push_back(point);
  }
  watermark_ = event_key;
}

// -----------------------------------------------------------------------------
// ratingBefore: first snapshot with timestamp >= t, then step back one
// -----------------------------------------------------------------------------
std::optional<domain::RatingSnapshot> RatingStore::ratingBefore(
    const domain::EntityKey& entity, domain::TimestampMs t) const {
  std::shared_lock lock(mutex_);
  auto it = histories_.find(entity);
  if (it == histories_.end()) {
    return std::nullopt;
  }
  const auto& history = it->second;
  auto pos = std::lower_bound(
      history.begin(), history.end(), t,
      [](const domain::RatingSnapshot& s, domain::TimestampMs value) {
        return s.timestamp_ms < value;
      });
  if (pos == history.begin()) {
    return std::nullopt;
  }
  return *std::prev(pos);
}

std::optional<domain::RatingSnapshot> RatingStore::latest(
    const domain::EntityKey& entity) const {
  std::shared_lock lock(mutex_);
  auto it = histories_.find(entity);
  if (it == histories_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

std::vector<domain::RatingSnapshot> RatingStore::history(
    const domain::EntityKey& entity) const {
  std::shared_lock lock(mutex_);
  auto it = histories_.find(entity);
  if (it == histories_.end()) {
    return {};
  }
  return it->second;
}

std::optional<PopulationMean> RatingStore::populationMeanBefore(
    domain::EntityKind kind, const std::string& stratum,
    domain::TimestampMs t) const {
  std::shared_lock lock(mutex_);
  auto it = population_.find({kind, stratum});
  if (it == population_.end()) {
    return std::nullopt;
  }
  const auto& series = it->second;
  auto pos = std::lower_bound(
      series.begin(), series.end(), t,
      [](const PopulationPoint& p, domain::TimestampMs value) {
        return p.timestamp_ms < value;
      });
  if (pos == series.begin()) {
    return std::nullopt;
  }
  const PopulationPoint& point = *std::prev(pos);
  if (point.cumulative_count == 0) {
    return std::nullopt;
  }
  PopulationMean out;
  out.mean = point.cumulative_sum / static_cast<double>(point.cumulative_count);
  out.observations = point.cumulative_count;
  out.timestamp_ms = point.timestamp_ms;
  return out;
}

std::optional<domain::EventKey> RatingStore::watermark() const {
  std::shared_lock lock(mutex_);
  return watermark_;
}

std::size_t RatingStore::entityCount() const {
  std::shared_lock lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(histories_.begin(), histories_.end(),
                    [](const auto& entry) { return !entry.second.empty(); }));
}

std::size_t RatingStore::snapshotCount() const {
  std::shared_lock lock(mutex_);
  std::size_t total = 0;
  for (const auto& [entity, history] : histories_) {
    total += history.size();
  }
  return total;
}

std::vector<domain::RatingRow> RatingStore::rows() const {
  std::shared_lock lock(mutex_);
  std::vector<const domain::EntityKey*> keys;
  keys.reserve(histories_.size());
  for (const auto& [entity, history] : histories_) {
    keys.push_back(&entity);
  }
  std::sort(keys.begin(), keys.end(),
            [](const domain::EntityKey* a, const domain::EntityKey* b) {
              return *a < *b;
            });

  std::vector<domain::RatingRow> out;
  for (const auto* key : keys) {
    for (const auto& s : histories_.at(*key)) {
      out.push_back(
          domain::RatingRow{*key, s.timestamp_ms, s.event_id, s.rating});
    }
  }
  return out;
}

}  // namespace turf

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace turf {
namespace domain {

// Identifier shared by competitors and agents. Ids are only unique within
// an EntityKind: horse 17 and jockey 17 are different entities.
using EntityId = std::uint64_t;

// -----------------------------------------------------------------------------
// EntityKind
// -----------------------------------------------------------------------------
// Competitor is the horse. Jockey and Trainer are auxiliary agents: they
// share the rating mechanic but are shrunk toward the population mean.
// -----------------------------------------------------------------------------
enum class EntityKind : std::uint8_t {
  Competitor = 0,
  Jockey = 1,
  Trainer = 2,
};

inline bool isAgent(EntityKind kind) { return kind != EntityKind::Competitor; }

inline const char* toString(EntityKind kind) {
  switch (kind) {
    case EntityKind::Competitor:
      return "competitor";
    case EntityKind::Jockey:
      return "jockey";
    case EntityKind::Trainer:
      return "trainer";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// AgentRef — one auxiliary agent attached to an entrant
// -----------------------------------------------------------------------------
struct AgentRef {
  EntityKind kind{EntityKind::Jockey};
  EntityId id{0};
};

// -----------------------------------------------------------------------------
// EntityKey — identity of one rating history
// -----------------------------------------------------------------------------
//
// @brief  (kind, id, stratum) triple that addresses a rating history in the
//         RatingStore.
//
// @details
// When ratings are kept globally, stratum is the empty string for every
// key. When RatingConfig::partition_by_stratum is set, the event's stratum
// (e.g. "flat", "hurdle") is copied into the key so that the same horse
// accumulates an independent history per discipline.
// -----------------------------------------------------------------------------
struct EntityKey {
  EntityKind kind{EntityKind::Competitor};
  EntityId id{0};
  std::string stratum;

  bool operator==(const EntityKey& other) const {
    return kind == other.kind && id == other.id && stratum == other.stratum;
  }
  bool operator!=(const EntityKey& other) const { return !(*this == other); }
  bool operator<(const EntityKey& other) const {
    return std::tie(kind, id, stratum) <
           std::tie(other.kind, other.id, other.stratum);
  }
};

// Human-readable form used in error messages and logs,
// e.g. "jockey#42" or "competitor#7@hurdle".
inline std::string describe(const EntityKey& key) {
  std::string out = toString(key.kind);
  out += '#';
  out += std::to_string(key.id);
  if (!key.stratum.empty()) {
    out += '@';
    out += key.stratum;
  }
  return out;
}

struct EntityKeyHash {
  std::size_t operator()(const EntityKey& key) const {
    std::size_t h = std::hash<std::uint64_t>{}(key.id);
    h ^= std::hash<int>{}(static_cast<int>(key.kind)) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(key.stratum) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    return h;
  }
};

}  // namespace domain
}  // namespace turf

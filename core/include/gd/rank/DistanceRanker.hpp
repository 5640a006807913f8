#pragma once
#include "gd/geo/Types.hpp"

#include <cstdint>
#include <vector>

namespace gd {

enum class DistanceBand : std::uint8_t {
  VeryClose = 0, // <= 5 km
  Close     = 1, // <= 15 km
  Medium    = 2, // <= 50 km
  Far       = 3,
  Unknown   = 4  // no usable coordinate
};

DistanceBand distanceBand(double distanceKm);

struct RankedEntity {
  const Entity* entity{nullptr};
  double distanceKm{0};     // +inf when unlocatable
  bool locatable{true};
  DistanceBand band{DistanceBand::Unknown};
};

struct RankConfig {
  bool includeUnlocatable{false};  // append unlocatable entities, unsorted
  double defaultDistanceKm{50.0};  // rankSmart: in-range group comes first
  std::size_t maxResults{50};      // rankSmart: 0 = unlimited
  double walkingSpeedKmh{3.0};     // ETA when no speed is known
};

// Annotates entities with their distance from an origin. Returned pointers
// refer into the caller's vector and are valid while it is unchanged.
class DistanceRanker {
public:
  DistanceRanker() = default;
  explicit DistanceRanker(const RankConfig& cfg) : config_(cfg) {}

  void setConfig(const RankConfig& cfg) { config_ = cfg; }
  const RankConfig& config() const { return config_; }

  // Ascending by distance; ties keep input order.
  std::vector<RankedEntity> rank(const std::vector<Entity>& entities,
                                 const Coordinate& origin) const;

  // Entities within defaultDistanceKm first, then the rest, truncated to maxResults.
  std::vector<RankedEntity> rankSmart(const std::vector<Entity>& entities,
                                      const Coordinate& origin) const;

  // Whole minutes, never negative or non-finite. Speed in m/s; absent or
  // non-positive speed falls back to walking pace.
  double estimateArrivalMinutes(double distanceKm) const;
  double estimateArrivalMinutes(double distanceKm, double speedMps) const;

private:
  RankConfig config_;
};

} // namespace gd

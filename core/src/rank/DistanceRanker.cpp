#include "gd/rank/DistanceRanker.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace gd {

DistanceBand distanceBand(double distanceKm) {
  if (!std::isfinite(distanceKm) || distanceKm < 0.0) return DistanceBand::Unknown;
  if (distanceKm <= 5.0)  return DistanceBand::VeryClose;
  if (distanceKm <= 15.0) return DistanceBand::Close;
  if (distanceKm <= 50.0) return DistanceBand::Medium;
  return DistanceBand::Far;
}

std::vector<RankedEntity> DistanceRanker::rank(const std::vector<Entity>& entities,
                                               const Coordinate& origin) const {
  std::vector<RankedEntity> ranked;
  std::vector<RankedEntity> unlocatable;
  ranked.reserve(entities.size());

  bool originOk = isValidCoordinate(origin);

  for (const auto& e : entities) {
    RankedEntity r;
    r.entity = &e;
    if (originOk && isValidCoordinate(e.location)) {
      r.distanceKm = distanceKm(origin, e.location);
      r.band = distanceBand(r.distanceKm);
      ranked.push_back(r);
    } else if (config_.includeUnlocatable) {
      r.distanceKm = std::numeric_limits<double>::infinity();
      r.locatable = false;
      unlocatable.push_back(r);
    }
  }

  std::stable_sort(ranked.begin(), ranked.end(),
    [](const RankedEntity& a, const RankedEntity& b) {
      return a.distanceKm < b.distanceKm;
    });

  ranked.insert(ranked.end(), unlocatable.begin(), unlocatable.end());
  return ranked;
}

std::vector<RankedEntity> DistanceRanker::rankSmart(const std::vector<Entity>& entities,
                                                    const Coordinate& origin) const {
  std::vector<RankedEntity> all = rank(entities, origin);

  // rank() is already ascending, so a stable partition keeps both groups sorted.
  double limit = config_.defaultDistanceKm;
  std::stable_partition(all.begin(), all.end(),
    [limit](const RankedEntity& r) { return r.locatable && r.distanceKm <= limit; });

  if (config_.maxResults > 0 && all.size() > config_.maxResults) {
    all.resize(config_.maxResults);
  }
  return all;
}

double DistanceRanker::estimateArrivalMinutes(double distanceKm) const {
  return estimateArrivalMinutes(distanceKm, 0.0);
}

double DistanceRanker::estimateArrivalMinutes(double distanceKm, double speedMps) const {
  if (!std::isfinite(distanceKm) || distanceKm <= 0.0) return 0.0;

  double kmh = config_.walkingSpeedKmh;
  if (std::isfinite(speedMps) && speedMps > 0.0) kmh = speedMps * 3.6;
  if (!(kmh > 0.0)) return 0.0;

  double minutes = std::round(distanceKm / kmh * 60.0);
  if (!std::isfinite(minutes)) return std::numeric_limits<double>::max();
  return minutes < 0.0 ? 0.0 : minutes;
}

} // namespace gd

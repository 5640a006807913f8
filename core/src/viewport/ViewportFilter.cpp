#include "gd/viewport/ViewportFilter.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>

namespace gd {

GeoBounds ViewportFilter::normalize(const GeoBounds& raw) {
  GeoBounds b = raw;

  if (b.south > b.north) std::swap(b.south, b.north);
  b.south = std::max(-90.0, std::min(90.0, b.south));
  b.north = std::max(-90.0, std::min(90.0, b.north));

  // Backends report unwrapped longitudes after panning across the dateline,
  // e.g. west=170, east=190.
  if (raw.east - raw.west >= 360.0) {
    b.west = -180.0;
    b.east = 180.0;
    return b;
  }
  b.west = normalizeLongitude(b.west);
  b.east = normalizeLongitude(b.east);
  return b;
}

std::vector<const Entity*> ViewportFilter::filter(const std::vector<Entity>& entities,
                                                  const GeoBounds& viewport) const {
  std::vector<const Entity*> visible;
  for (const auto& e : entities) {
    if (!isValidCoordinate(e.location)) continue;
    if (contains(viewport, e.location)) visible.push_back(&e);
  }
  return visible;
}

std::vector<const Entity*> ViewportFilter::filter(const std::vector<const Entity*>& entities,
                                                  const GeoBounds& viewport) const {
  std::vector<const Entity*> visible;
  for (const Entity* e : entities) {
    if (!e || !isValidCoordinate(e->location)) continue;
    if (contains(viewport, e->location)) visible.push_back(e);
  }
  return visible;
}

} // namespace gd

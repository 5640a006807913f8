#pragma once
#include "gd/geo/Types.hpp"

#include <vector>

namespace gd {

// Stateless visibility test. Callers driving this from camera-drag events
// are expected to debounce upstream (100-200 ms); repeated calls with the
// same inputs are harmless.
class ViewportFilter {
public:
  // Clamps latitudes, orders south/north, wraps longitudes into
  // [-180, 180]. A span of 360 degrees or more becomes the whole world;
  // otherwise west > east after wrapping marks an antimeridian crossing.
  static GeoBounds normalize(const GeoBounds& raw);

  // Visible subset in input order. Unlocatable entities are skipped.
  std::vector<const Entity*> filter(const std::vector<Entity>& entities,
                                    const GeoBounds& viewport) const;

  std::vector<const Entity*> filter(const std::vector<const Entity*>& entities,
                                    const GeoBounds& viewport) const;
};

} // namespace gd

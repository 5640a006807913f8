#include "gd/geo/Projection.hpp"

#include <algorithm>
#include <cmath>

namespace gd {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kMaxMercatorLat = 85.05112878;
} // namespace

double WebMercatorProjection::worldSize(double zoom) const {
  return tileSize_ * std::pow(2.0, zoom);
}

PixelPoint WebMercatorProjection::project(const Coordinate& c, double zoom) const {
  double lat = std::max(-kMaxMercatorLat, std::min(kMaxMercatorLat, c.lat));
  double size = worldSize(zoom);
  double sinLat = std::sin(lat * kPi / 180.0);

  PixelPoint p;
  p.x = (c.lng + 180.0) / 360.0 * size;
  p.y = (0.5 - std::log((1.0 + sinLat) / (1.0 - sinLat)) / (4.0 * kPi)) * size;
  return p;
}

Coordinate WebMercatorProjection::unproject(const PixelPoint& p, double zoom) const {
  double size = worldSize(zoom);
  double nx = p.x / size;
  double ny = 0.5 - p.y / size;

  Coordinate c;
  c.lng = nx * 360.0 - 180.0;
  c.lat = 90.0 - 360.0 * std::atan(std::exp(-ny * 2.0 * kPi)) / kPi;
  return c;
}

} // namespace gd

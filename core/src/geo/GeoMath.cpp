#include "gd/geo/GeoMath.hpp"

#include <cmath>

namespace gd {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;
} // namespace

double distanceKm(const Coordinate& a, const Coordinate& b) {
  double dLat = (b.lat - a.lat) * kDegToRad;
  double dLng = (b.lng - a.lng) * kDegToRad;
  double sLat = std::sin(dLat * 0.5);
  double sLng = std::sin(dLng * 0.5);
  double h = sLat * sLat +
             std::cos(a.lat * kDegToRad) * std::cos(b.lat * kDegToRad) * sLng * sLng;
  if (h > 1.0) h = 1.0; // rounding near antipodes
  double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return kEarthRadiusKm * c;
}

double bearingDeg(const Coordinate& a, const Coordinate& b) {
  double lat1 = a.lat * kDegToRad;
  double lat2 = b.lat * kDegToRad;
  double dLng = (b.lng - a.lng) * kDegToRad;

  double y = std::sin(dLng) * std::cos(lat2);
  double x = std::cos(lat1) * std::sin(lat2) -
             std::sin(lat1) * std::cos(lat2) * std::cos(dLng);
  double deg = std::atan2(y, x) * kRadToDeg;
  deg = std::fmod(deg + 360.0, 360.0);
  if (deg >= 360.0) deg = 0.0;
  return deg;
}

bool crossesAntimeridian(const GeoBounds& bounds) {
  return bounds.west > bounds.east;
}

int splitAtAntimeridian(const GeoBounds& bounds, GeoBounds out[2]) {
  if (!crossesAntimeridian(bounds)) {
    out[0] = bounds;
    return 1;
  }
  out[0] = GeoBounds{bounds.west, bounds.south, 180.0, bounds.north};
  out[1] = GeoBounds{-180.0, bounds.south, bounds.east, bounds.north};
  return 2;
}

bool contains(const GeoBounds& bounds, const Coordinate& c) {
  if (c.lat < bounds.south || c.lat > bounds.north) return false;
  if (crossesAntimeridian(bounds)) {
    return c.lng >= bounds.west || c.lng <= bounds.east;
  }
  return c.lng >= bounds.west && c.lng <= bounds.east;
}

bool isValidCoordinate(const Coordinate& c) {
  if (!std::isfinite(c.lat) || !std::isfinite(c.lng)) return false;
  if (c.lat < -90.0 || c.lat > 90.0) return false;
  if (c.lng < -180.0 || c.lng > 180.0) return false;
  // (0,0) is what upstream writes when a location is missing
  if (c.lat == 0.0 && c.lng == 0.0) return false;
  return true;
}

double normalizeLongitude(double lng) {
  if (lng >= -180.0 && lng <= 180.0) return lng;
  double w = std::fmod(lng + 180.0, 360.0);
  if (w < 0) w += 360.0;
  return w - 180.0;
}

} // namespace gd

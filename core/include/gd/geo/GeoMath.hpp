#pragma once
#include "gd/geo/Types.hpp"

namespace gd {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance (haversine) in kilometres.
double distanceKm(const Coordinate& a, const Coordinate& b);

// Initial bearing from a to b, degrees in [0, 360).
double bearingDeg(const Coordinate& a, const Coordinate& b);

// Inclusive containment. Handles antimeridian-crossing bounds (west > east).
bool contains(const GeoBounds& bounds, const Coordinate& c);

// True when the bounds wrap across the 180th meridian.
bool crossesAntimeridian(const GeoBounds& bounds);

// Splits bounds into one or two non-wrapping boxes. Returns the count.
int splitAtAntimeridian(const GeoBounds& bounds, GeoBounds out[2]);

// Finite, in range, and not the (0,0) "missing" sentinel.
bool isValidCoordinate(const Coordinate& c);

// Wraps a longitude into [-180, 180].
double normalizeLongitude(double lng);

} // namespace gd

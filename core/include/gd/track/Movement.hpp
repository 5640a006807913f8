#pragma once
#include <cstdint>

namespace gd {

enum class MovementDirection : std::uint8_t { Unknown, North, East, South, West };

enum class SpeedClass : std::uint8_t {
  Stationary, // no speed reported
  Walking,    // < 0.5 m/s
  Slow,       // < 2 m/s
  Moving,     // < 5 m/s
  Fast,       // < 10 m/s
  VeryFast
};

// Quadrant of a compass heading; North covers [315, 45).
MovementDirection movementDirection(bool hasHeading, double headingDeg);
SpeedClass speedClass(bool hasSpeed, double speedMps);

const char* directionName(MovementDirection d);
const char* speedDescription(SpeedClass s);

} // namespace gd

#include "gd/track/Movement.hpp"

#include <cmath>

namespace gd {

MovementDirection movementDirection(bool hasHeading, double headingDeg) {
  if (!hasHeading || !std::isfinite(headingDeg)) return MovementDirection::Unknown;
  double h = std::fmod(headingDeg, 360.0);
  if (h < 0) h += 360.0;
  if (h >= 315.0 || h < 45.0) return MovementDirection::North;
  if (h < 135.0) return MovementDirection::East;
  if (h < 225.0) return MovementDirection::South;
  return MovementDirection::West;
}

SpeedClass speedClass(bool hasSpeed, double speedMps) {
  if (!hasSpeed || !std::isfinite(speedMps) || speedMps <= 0.0) return SpeedClass::Stationary;
  if (speedMps < 0.5)  return SpeedClass::Walking;
  if (speedMps < 2.0)  return SpeedClass::Slow;
  if (speedMps < 5.0)  return SpeedClass::Moving;
  if (speedMps < 10.0) return SpeedClass::Fast;
  return SpeedClass::VeryFast;
}

const char* directionName(MovementDirection d) {
  switch (d) {
    case MovementDirection::North: return "north";
    case MovementDirection::East:  return "east";
    case MovementDirection::South: return "south";
    case MovementDirection::West:  return "west";
    case MovementDirection::Unknown: return "unknown";
  }
  return "unknown";
}

const char* speedDescription(SpeedClass s) {
  switch (s) {
    case SpeedClass::Stationary: return "Stationary";
    case SpeedClass::Walking:    return "Walking";
    case SpeedClass::Slow:       return "Slow movement";
    case SpeedClass::Moving:     return "Moving";
    case SpeedClass::Fast:       return "Fast movement";
    case SpeedClass::VeryFast:   return "Very fast";
  }
  return "Stationary";
}

} // namespace gd

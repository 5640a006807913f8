#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gd {

struct Coordinate {
  double lat{0};
  double lng{0};

  bool operator==(const Coordinate& o) const { return lat == o.lat && lng == o.lng; }
  bool operator!=(const Coordinate& o) const { return !(*this == o); }
};

// Point of interest. Immutable once handed to the engine.
struct Entity {
  std::string id;
  std::string name;
  Coordinate location;
  std::vector<std::string> tags;
};

// Geographic rectangle as reported by the map backend.
// west > east means the box crosses the antimeridian.
struct GeoBounds {
  double west{-180}, south{-90}, east{180}, north{90};
};

// Screen-space position in pixels at a given zoom.
struct PixelPoint {
  double x{0}, y{0};
};

// One reading from a position source.
struct TrackedPosition {
  Coordinate location;
  double accuracyM{0};
  std::int64_t timestampMs{0};

  bool hasSpeed{false};
  double speedMps{0};     // metres per second
  bool hasHeading{false};
  double headingDeg{0};   // clockwise from north
};

struct CameraState {
  Coordinate center;
  double zoom{0};
};

} // namespace gd

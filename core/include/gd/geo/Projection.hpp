#pragma once
#include "gd/geo/Types.hpp"

namespace gd {

// Screen projection supplied by the map backend.
class Projection {
public:
  virtual ~Projection() = default;
  virtual PixelPoint project(const Coordinate& c, double zoom) const = 0;
};

// Spherical Web Mercator in world pixels (origin at the north-west corner).
class WebMercatorProjection : public Projection {
public:
  explicit WebMercatorProjection(double tileSize = 256.0) : tileSize_(tileSize) {}

  PixelPoint project(const Coordinate& c, double zoom) const override;
  Coordinate unproject(const PixelPoint& p, double zoom) const;

  double worldSize(double zoom) const;
  double tileSize() const { return tileSize_; }

private:
  double tileSize_;
};

} // namespace gd

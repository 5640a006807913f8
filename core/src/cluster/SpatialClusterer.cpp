#include "gd/cluster/SpatialClusterer.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace gd {

namespace {

std::uint64_t cellKey(std::int64_t cx, std::int64_t cy) {
  return (static_cast<std::uint64_t>(cx) << 32) ^
         (static_cast<std::uint64_t>(cy) & 0xFFFFFFFFull);
}

Cluster makeCluster(const std::vector<ClusterMember>& points,
                    const std::vector<std::size_t>& idx, int level) {
  Cluster c;
  c.zoom = level;
  c.members.reserve(idx.size());

  double sumLat = 0.0, sumLng = 0.0;
  GeoBounds ext{180.0, 90.0, -180.0, -90.0};
  for (std::size_t i : idx) {
    const auto& p = points[i];
    c.members.push_back(p);
    sumLat += p.location.lat;
    sumLng += p.location.lng;
    ext.west  = std::min(ext.west, p.location.lng);
    ext.east  = std::max(ext.east, p.location.lng);
    ext.south = std::min(ext.south, p.location.lat);
    ext.north = std::max(ext.north, p.location.lat);
  }

  double n = static_cast<double>(idx.size());
  c.centroid.lat = sumLat / n;
  c.centroid.lng = sumLng / n;
  c.extent = ext;
  return c;
}

} // namespace

SpatialClusterer::SpatialClusterer(const ClusterConfig& cfg) {
  setConfig(cfg);
}

void SpatialClusterer::setConfig(const ClusterConfig& cfg) {
  if (cfg.radiusTable.empty()) {
    throw std::invalid_argument("SpatialClusterer: radius table is empty");
  }
  for (const auto& step : cfg.radiusTable) {
    if (!(step.radiusPx > 0.0)) {
      throw std::invalid_argument("SpatialClusterer: radius must be positive");
    }
  }
  config_ = cfg;
  std::sort(config_.radiusTable.begin(), config_.radiusTable.end(),
    [](const RadiusStep& a, const RadiusStep& b) { return a.minZoom < b.minZoom; });
  if (config_.minPoints < 1) config_.minPoints = 1;
}

const Projection& SpatialClusterer::projection() const {
  return projection_ ? *projection_ : defaultProjection_;
}

int SpatialClusterer::zoomLevel(double zoom) const {
  if (!std::isfinite(zoom)) return config_.minZoom;
  int level = static_cast<int>(std::floor(zoom));
  return std::max(config_.minZoom, level);
}

double SpatialClusterer::radiusForZoom(int zoomLevel) const {
  double r = config_.radiusTable.front().radiusPx;
  for (const auto& step : config_.radiusTable) {
    if (step.minZoom > zoomLevel) break;
    r = step.radiusPx;
  }
  return r;
}

ClusterResult SpatialClusterer::cluster(const std::vector<const Entity*>& visible,
                                        double zoom) const {
  std::vector<ClusterMember> points;
  points.reserve(visible.size());
  for (const Entity* e : visible) {
    if (!e) continue;
    points.push_back(ClusterMember{e->id, e->location});
  }
  return cluster(points, zoom);
}

ClusterResult SpatialClusterer::cluster(const std::vector<ClusterMember>& points,
                                        double zoom) const {
  ClusterResult result;
  result.zoom = zoomLevel(zoom);
  result.radiusPx = radiusForZoom(result.zoom);
  result.clusteringEnabled = clusteringEnabledAt(result.zoom);
  result.clusters = build(points, result.zoom);
  for (std::size_t i = 0; i < result.clusters.size(); i++) {
    result.clusters[i].id = static_cast<std::uint32_t>(i);
  }
  return result;
}

std::vector<Cluster> SpatialClusterer::build(const std::vector<ClusterMember>& points,
                                             int level) const {
  std::vector<Cluster> out;
  out.reserve(points.size());

  if (!clusteringEnabledAt(level)) {
    for (std::size_t i = 0; i < points.size(); i++) {
      out.push_back(makeCluster(points, {i}, level));
    }
    return out;
  }

  const double r = radiusForZoom(level);
  const double r2 = r * r;
  const Projection& proj = projection();

  std::vector<PixelPoint> px(points.size());
  std::unordered_map<std::uint64_t, std::vector<std::size_t>> grid;
  grid.reserve(points.size());

  for (std::size_t i = 0; i < points.size(); i++) {
    px[i] = proj.project(points[i].location, static_cast<double>(level));
    auto cx = static_cast<std::int64_t>(std::floor(px[i].x / r));
    auto cy = static_cast<std::int64_t>(std::floor(px[i].y / r));
    grid[cellKey(cx, cy)].push_back(i);
  }

  std::vector<bool> assigned(points.size(), false);
  std::vector<std::size_t> members;

  for (std::size_t i = 0; i < points.size(); i++) {
    if (assigned[i]) continue;
    assigned[i] = true;
    members.clear();
    members.push_back(i);

    const PixelPoint& seed = px[i];
    auto cx = static_cast<std::int64_t>(std::floor(seed.x / r));
    auto cy = static_cast<std::int64_t>(std::floor(seed.y / r));

    for (std::int64_t gx = cx - 1; gx <= cx + 1; gx++) {
      for (std::int64_t gy = cy - 1; gy <= cy + 1; gy++) {
        auto it = grid.find(cellKey(gx, gy));
        if (it == grid.end()) continue;
        for (std::size_t j : it->second) {
          if (assigned[j]) continue;
          double dx = px[j].x - seed.x;
          double dy = px[j].y - seed.y;
          if (dx * dx + dy * dy <= r2) {
            assigned[j] = true;
            members.push_back(j);
          }
        }
      }
    }

    if (members.size() < config_.minPoints) {
      for (std::size_t m : members) out.push_back(makeCluster(points, {m}, level));
    } else {
      std::sort(members.begin(), members.end());
      out.push_back(makeCluster(points, members, level));
    }
  }

  return out;
}

bool SpatialClusterer::separatesAt(const Cluster& cluster, int level) const {
  if (!clusteringEnabledAt(level)) return true;
  std::size_t largest = 0;
  for (const auto& c : build(cluster.members, level)) {
    largest = std::max(largest, c.size());
  }
  return largest * 2 <= cluster.size();
}

int SpatialClusterer::expansionZoom(const Cluster& cluster) const {
  if (cluster.size() <= 1) return cluster.zoom;

  int lo = cluster.zoom + 1;
  int hi = std::min(config_.maxExpansionZoom, config_.maxClusterZoom + 1);
  if (lo >= hi) return std::max(cluster.zoom, hi);

  // Separation is close to monotonic in zoom, so binary search first and
  // then walk upward in case the greedy pass disagrees at the boundary.
  int a = lo, b = hi;
  while (a < b) {
    int mid = a + (b - a) / 2;
    if (separatesAt(cluster, mid)) {
      b = mid;
    } else {
      a = mid + 1;
    }
  }
  while (a < hi && !separatesAt(cluster, a)) a++;
  return a;
}

} // namespace gd

#pragma once
#include "gd/geo/Projection.hpp"
#include "gd/geo/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gd {

struct RadiusStep {
  int minZoom;      // applies from this zoom level upward
  double radiusPx;
};

struct ClusterConfig {
  std::vector<RadiusStep> radiusTable = {
    {0, 80.0},
    {8, 60.0},
    {12, 50.0},
    {15, 40.0},
  };
  int minZoom{0};
  int maxClusterZoom{16};     // above this every entity renders on its own
  int maxExpansionZoom{17};   // cap for expansionZoom()
  std::size_t minPoints{2};   // smaller groups are emitted as singletons
};

struct ClusterMember {
  std::string id;
  Coordinate location;
};

struct Cluster {
  std::uint32_t id{0};        // index within the result it came from
  Coordinate centroid;        // arithmetic mean of member coordinates
  GeoBounds extent;           // member bounding box
  int zoom{0};                // zoom level it was built at
  std::vector<ClusterMember> members;

  std::size_t size() const { return members.size(); }
  bool isSingleton() const { return members.size() == 1; }
};

struct ClusterResult {
  std::vector<Cluster> clusters;
  int zoom{0};
  double radiusPx{0};
  bool clusteringEnabled{true};
};

// Greedy grid-bucket clustering in screen space.
//
// Points are projected at the integer zoom level and hashed into cells the
// size of the clustering radius. Each unassigned point seeds a cluster and
// absorbs every unassigned point in the surrounding 3x3 cells that lies
// within the radius of the seed. This is approximate by design: membership
// depends on input order and a point may sit closer to another cluster's
// seed than to its own. Longitudes are not wrapped across the antimeridian.
class SpatialClusterer {
public:
  SpatialClusterer() = default;
  explicit SpatialClusterer(const ClusterConfig& cfg);

  // Throws std::invalid_argument for an empty table or a non-positive radius.
  void setConfig(const ClusterConfig& cfg);
  const ClusterConfig& config() const { return config_; }

  // Backend projection; nullptr restores the built-in Web Mercator.
  // Not owned, must outlive the clusterer.
  void setProjection(const Projection* projection) { projection_ = projection; }

  int zoomLevel(double zoom) const;
  double radiusForZoom(int zoomLevel) const;
  bool clusteringEnabledAt(int zoomLevel) const { return zoomLevel <= config_.maxClusterZoom; }

  // Every input entity lands in exactly one cluster. Pure: no state is kept
  // between calls.
  ClusterResult cluster(const std::vector<const Entity*>& visible, double zoom) const;
  ClusterResult cluster(const std::vector<ClusterMember>& points, double zoom) const;

  // Smallest zoom above cluster.zoom at which re-clustering the members
  // leaves no group larger than half the cluster, capped at maxExpansionZoom.
  int expansionZoom(const Cluster& cluster) const;

private:
  const Projection& projection() const;
  std::vector<Cluster> build(const std::vector<ClusterMember>& points, int level) const;
  bool separatesAt(const Cluster& cluster, int level) const;

  ClusterConfig config_;
  WebMercatorProjection defaultProjection_;
  const Projection* projection_{nullptr};
};

} // namespace gd

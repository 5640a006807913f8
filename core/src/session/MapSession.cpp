#include "gd/session/MapSession.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cstdio>

namespace gd {

MapSession::MapSession(const EntityStore& store, PositionSource& source)
  : MapSession(store, source, EngineConfig{}) {}

MapSession::MapSession(const EntityStore& store, PositionSource& source,
                       const EngineConfig& cfg)
  : store_(store), tracker_(source) {
  setConfig(cfg);
  tracker_.setEntities(&store_.entities());
}

void MapSession::setConfig(const EngineConfig& cfg) {
  clusterer_.setConfig(cfg.cluster);
  ranker_.setConfig(cfg.rank);
  controller_.setConfig(cfg.transition);
  tracker_.setConfig(cfg.tracker);
  config_ = cfg;
  hasRender_ = false;
}

void MapSession::setProjection(const Projection* projection) {
  clusterer_.setProjection(projection);
  hasRender_ = false;
}

static bool sameBounds(const GeoBounds& a, const GeoBounds& b) {
  return a.west == b.west && a.south == b.south && a.east == b.east && a.north == b.north;
}

bool MapSession::onViewportChange(const GeoBounds& bounds, double zoom) {
  if (hasRender_ && sameBounds(bounds, lastRaw_) && zoom == lastZoom_ &&
      store_.revision() == renderedRevision_) {
    return false;
  }
  lastRaw_ = bounds;
  lastZoom_ = zoom;
  recompute(ViewportFilter::normalize(bounds), zoom);
  return true;
}

void MapSession::recompute(const GeoBounds& viewport, double zoom) {
  std::vector<const Entity*> visible = filter_.filter(store_.locatable(), viewport);
  ClusterResult result = clusterer_.cluster(visible, zoom);

  render_.viewport = viewport;
  render_.zoom = zoom;
  render_.zoomLevel = result.zoom;
  render_.radiusPx = result.radiusPx;
  render_.clusteringEnabled = result.clusteringEnabled;
  render_.visibleCount = visible.size();
  render_.clusters = std::move(result.clusters);
  render_.generation++;

  hasRender_ = true;
  renderedRevision_ = store_.revision();
}

TransitionId MapSession::selectEntity(const std::string& id, double nowMs,
                                      TransitionCompleteCallback onComplete) {
  const Entity* e = store_.get(id);
  if (!e || !isValidCoordinate(e->location)) {
    std::fprintf(stderr, "MapSession: cannot select '%s': not locatable\n", id.c_str());
    return 0;
  }
  CameraState target;
  target.center = e->location;
  target.zoom = std::max(controller_.sample(nowMs).zoom, sessionConfig_.entityFocusZoom);
  return controller_.transitionTo(target, nowMs, std::move(onComplete));
}

TransitionId MapSession::selectCluster(const Cluster& cluster, double nowMs,
                                       TransitionCompleteCallback onComplete) {
  if (cluster.members.empty()) return 0;
  if (cluster.isSingleton()) {
    return selectEntity(cluster.members.front().id, nowMs, std::move(onComplete));
  }
  CameraState target;
  target.center = cluster.centroid;
  target.zoom = static_cast<double>(clusterer_.expansionZoom(cluster));
  return controller_.transitionTo(target, nowMs, std::move(onComplete));
}

std::vector<const Entity*> MapSession::clusterMembers(std::uint32_t clusterId) const {
  std::vector<const Entity*> out;
  for (const auto& c : render_.clusters) {
    if (c.id != clusterId) continue;
    out.reserve(c.members.size());
    for (const auto& m : c.members) {
      if (const Entity* e = store_.get(m.id)) out.push_back(e);
    }
    break;
  }
  return out;
}

std::vector<RankedEntity> MapSession::nearest(const Coordinate& origin) const {
  return ranker_.rankSmart(store_.entities(), origin);
}

void MapSession::startTracking() {
  tracker_.setEntities(&store_.entities());
  tracker_.start();
}

} // namespace gd

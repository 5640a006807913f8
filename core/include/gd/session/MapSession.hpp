#pragma once
#include "gd/camera/TransitionController.hpp"
#include "gd/cluster/SpatialClusterer.hpp"
#include "gd/config/EngineConfig.hpp"
#include "gd/entity/EntityStore.hpp"
#include "gd/rank/DistanceRanker.hpp"
#include "gd/track/LiveLocationTracker.hpp"
#include "gd/viewport/ViewportFilter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gd {

struct MapSessionConfig {
  double entityFocusZoom{15.0};  // selecting an entity zooms in at least this far
};

// What the map backend should draw for the current viewport.
struct RenderSet {
  GeoBounds viewport;              // normalized
  double zoom{0};
  int zoomLevel{0};
  double radiusPx{0};
  bool clusteringEnabled{true};
  std::size_t visibleCount{0};
  std::vector<Cluster> clusters;
  std::uint64_t generation{0};     // bumped on every recompute
};

// Wires the engine components to one map view.
//
// Viewport changes flow through ViewportFilter and SpatialClusterer into a
// RenderSet. Selections become camera transitions. The tracker reads the
// store's entity list directly. Everything runs on the host thread.
class MapSession {
public:
  MapSession(const EntityStore& store, PositionSource& source);
  MapSession(const EntityStore& store, PositionSource& source, const EngineConfig& cfg);

  MapSession(const MapSession&) = delete;
  MapSession& operator=(const MapSession&) = delete;

  // Throws std::invalid_argument if the cluster table is unusable.
  void setConfig(const EngineConfig& cfg);
  void setSessionConfig(const MapSessionConfig& cfg) { sessionConfig_ = cfg; }
  const EngineConfig& config() const { return config_; }

  void setCameraSink(CameraSink sink) { controller_.setCameraSink(std::move(sink)); }
  void setProjection(const Projection* projection);

  // Returns true when the render set was recomputed. Repeating the last
  // viewport and zoom against an unchanged store is a no-op.
  bool onViewportChange(const GeoBounds& bounds, double zoom);
  const RenderSet& renderSet() const { return render_; }

  // Backend reported a camera move the engine did not drive.
  void onCameraMoved(const CameraState& state) { controller_.syncCamera(state); }

  // Returns 0 when the id is unknown or the entity has no usable coordinate.
  TransitionId selectEntity(const std::string& id, double nowMs,
                            TransitionCompleteCallback onComplete = {});
  // Flies to the cluster centroid at its expansion zoom.
  TransitionId selectCluster(const Cluster& cluster, double nowMs,
                             TransitionCompleteCallback onComplete = {});

  CameraFrame advance(double nowMs) { return controller_.advance(nowMs); }

  // Entities of the current render set's cluster with this id.
  std::vector<const Entity*> clusterMembers(std::uint32_t clusterId) const;

  // Distance-ranked store contents around an origin.
  std::vector<RankedEntity> nearest(const Coordinate& origin) const;

  void startTracking();
  void stopTracking() { tracker_.stop(); }

  LiveLocationTracker& tracker() { return tracker_; }
  const LiveLocationTracker& tracker() const { return tracker_; }
  TransitionController& camera() { return controller_; }
  const TransitionController& camera() const { return controller_; }
  const SpatialClusterer& clusterer() const { return clusterer_; }

private:
  void recompute(const GeoBounds& viewport, double zoom);

  const EntityStore& store_;
  EngineConfig config_;
  MapSessionConfig sessionConfig_;

  ViewportFilter filter_;
  SpatialClusterer clusterer_;
  DistanceRanker ranker_;
  TransitionController controller_;
  LiveLocationTracker tracker_;

  RenderSet render_;
  bool hasRender_{false};
  std::uint64_t renderedRevision_{0};
  GeoBounds lastRaw_;
  double lastZoom_{0};
};

} // namespace gd

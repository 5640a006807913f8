#pragma once
#include "gd/camera/TransitionController.hpp"
#include "gd/cluster/SpatialClusterer.hpp"
#include "gd/rank/DistanceRanker.hpp"
#include "gd/track/LiveLocationTracker.hpp"

#include <string>

namespace gd {

// Construction-time parameters for every engine component.
struct EngineConfig {
  std::string version{"1.0"};
  ClusterConfig cluster;
  RankConfig rank;
  TrackerConfig tracker;
  TransitionConfig transition;
};

std::string serializeEngineConfig(const EngineConfig& cfg);

// Fields missing from the document keep the value already in `out`.
// Returns false, leaving `out` untouched, on malformed JSON or values the
// engine cannot run with (non-positive radii, unknown easing, ...).
bool deserializeEngineConfig(const std::string& json, EngineConfig& out);

} // namespace gd

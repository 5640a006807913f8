#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace gd {

// Visual size class of a cluster marker, by member count.
enum class ClusterTier : std::uint8_t {
  Single = 0, // 1
  Tiny   = 1, // 2+
  Small  = 2, // 5+
  Medium = 3, // 10+
  Large  = 4, // 20+
  Mega   = 5  // 50+
};

ClusterTier clusterTier(std::size_t memberCount);
const char* tierName(ClusterTier tier);

// Zoom a tap on a cluster of this tier should fly to when no exact
// expansion zoom is wanted.
int tierTargetZoom(ClusterTier tier);

// Marker label: "99+" from 100 members up.
std::string formatClusterCount(std::size_t memberCount);

} // namespace gd

#include "gd/cluster/ClusterTier.hpp"

namespace gd {

ClusterTier clusterTier(std::size_t memberCount) {
  if (memberCount >= 50) return ClusterTier::Mega;
  if (memberCount >= 20) return ClusterTier::Large;
  if (memberCount >= 10) return ClusterTier::Medium;
  if (memberCount >= 5)  return ClusterTier::Small;
  if (memberCount >= 2)  return ClusterTier::Tiny;
  return ClusterTier::Single;
}

const char* tierName(ClusterTier tier) {
  switch (tier) {
    case ClusterTier::Single: return "single";
    case ClusterTier::Tiny:   return "tiny";
    case ClusterTier::Small:  return "small";
    case ClusterTier::Medium: return "medium";
    case ClusterTier::Large:  return "large";
    case ClusterTier::Mega:   return "mega";
  }
  return "single";
}

int tierTargetZoom(ClusterTier tier) {
  switch (tier) {
    case ClusterTier::Mega:   return 10;
    case ClusterTier::Large:  return 12;
    case ClusterTier::Medium: return 13;
    case ClusterTier::Small:  return 14;
    case ClusterTier::Tiny:   return 15;
    case ClusterTier::Single: return 16;
  }
  return 16;
}

std::string formatClusterCount(std::size_t memberCount) {
  if (memberCount >= 100) return "99+";
  return std::to_string(memberCount);
}

} // namespace gd

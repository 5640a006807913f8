#include "gd/camera/Easing.hpp"

#include <cmath>
#include <cstring>

namespace gd {

double applyEasing(Easing easing, double t) {
  if (!(t > 0.0)) return 0.0;
  if (t >= 1.0) return 1.0;

  switch (easing) {
    case Easing::Linear:
      return t;
    case Easing::EaseOutCubic: {
      double u = 1.0 - t;
      return 1.0 - u * u * u;
    }
    case Easing::EaseInOutCubic: {
      if (t < 0.5) return 4.0 * t * t * t;
      double u = -2.0 * t + 2.0;
      return 1.0 - u * u * u / 2.0;
    }
  }
  return t;
}

const char* easingName(Easing easing) {
  switch (easing) {
    case Easing::Linear:         return "linear";
    case Easing::EaseOutCubic:   return "easeOutCubic";
    case Easing::EaseInOutCubic: return "easeInOutCubic";
  }
  return "linear";
}

bool parseEasing(const char* name, Easing& out) {
  if (!name) return false;
  if (std::strcmp(name, "linear") == 0)         { out = Easing::Linear; return true; }
  if (std::strcmp(name, "easeOutCubic") == 0)   { out = Easing::EaseOutCubic; return true; }
  if (std::strcmp(name, "easeInOutCubic") == 0) { out = Easing::EaseInOutCubic; return true; }
  return false;
}

} // namespace gd

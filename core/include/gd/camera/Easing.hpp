#pragma once
#include <cstdint>

namespace gd {

// All curves map [0,1] onto [0,1] monotonically with f(0)=0 and f(1)=1.
enum class Easing : std::uint8_t {
  Linear         = 0,
  EaseOutCubic   = 1,
  EaseInOutCubic = 2
};

// Input is clamped to [0,1].
double applyEasing(Easing easing, double t);

const char* easingName(Easing easing);
bool parseEasing(const char* name, Easing& out);

} // namespace gd

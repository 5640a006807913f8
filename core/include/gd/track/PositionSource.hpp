#pragma once
#include "gd/geo/Types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace gd {

enum class PositionErrorCode : std::uint8_t {
  PermissionDenied = 1,
  Unavailable      = 2,
  Timeout          = 3
};

struct PositionError {
  PositionErrorCode code{PositionErrorCode::Unavailable};
  std::string message;
};

using PositionCallback      = std::function<void(const TrackedPosition&)>;
using PositionErrorCallback = std::function<void(const PositionError&)>;

// Device geolocation as seen by the tracker. Callbacks must be delivered on
// the host's event thread; the tracker is not reentrant across threads.
class PositionSource {
public:
  virtual ~PositionSource() = default;

  // Subscribe to continuous high-accuracy updates. The first delivered
  // reading is treated as the initial fix.
  virtual void start(PositionCallback onUpdate, PositionErrorCallback onError) = 0;

  // Cancel the subscription. Must be safe to call from inside a callback.
  virtual void stop() = 0;
  virtual bool isRunning() const = 0;
};

} // namespace gd

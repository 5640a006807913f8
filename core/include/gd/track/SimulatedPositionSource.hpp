#pragma once
#include "gd/track/PositionSource.hpp"
#include "gd/track/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

namespace gd {

struct SimulatedRouteConfig {
  std::vector<Coordinate> waypoints;  // empty: readings only come from inject()
  double speedMps{1.4};
  int intervalMs{1000};               // wall-clock time between readings
  double timeScale{1.0};              // simulated seconds per wall second
  double accuracyM{5.0};
  std::int64_t startTimestampMs{0};
  bool loop{false};
  std::size_t maxQueued{64};
};

// Position source for demos and tests. A producer thread walks the route and
// queues readings; the host calls pump() from its event loop, which invokes
// the tracker callbacks on the host thread.
class SimulatedPositionSource : public PositionSource {
public:
  SimulatedPositionSource();
  explicit SimulatedPositionSource(const SimulatedRouteConfig& config);
  ~SimulatedPositionSource() override;

  void start(PositionCallback onUpdate, PositionErrorCallback onError) override;
  void stop() override;
  bool isRunning() const override;

  // Queue a reading or error as if the device had produced it.
  void inject(const TrackedPosition& reading);
  void injectError(const PositionError& error);

  // Deliver queued events. Returns how many callbacks were invoked.
  std::size_t pump();

  bool routeFinished() const { return finished_.load(); }
  std::size_t droppedEvents() const { return queue_.dropped(); }

private:
  struct Event {
    bool isError{false};
    TrackedPosition reading;
    PositionError error;
  };

  void producerLoop();
  TrackedPosition sampleRoute(double travelledM, bool& atEnd) const;

  SimulatedRouteConfig config_;
  ThreadSafeQueue<Event> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> finished_{false};

  // Host-thread only.
  PositionCallback onUpdate_;
  PositionErrorCallback onError_;
  std::uint64_t generation_{0};
};

} // namespace gd

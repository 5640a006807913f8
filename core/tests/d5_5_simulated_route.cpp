// D5.5 - SimulatedPositionSource: producer thread walks a route, host pumps

#include "gd/track/LiveLocationTracker.hpp"
#include "gd/track/SimulatedPositionSource.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: Route readings reach the tracker in order ----
  {
    gd::SimulatedRouteConfig route;
    route.waypoints = {{51.50, -0.10}, {51.52, -0.10}};   // ~2.2 km north
    route.speedMps = 50.0;
    route.intervalMs = 5;
    route.timeScale = 200.0;       // one simulated second per tick
    route.startTimestampMs = 1000;
    route.maxQueued = 1024;

    gd::SimulatedPositionSource src(route);
    gd::LiveLocationTracker tracker(src);

    gd::Entity dest;
    dest.id = "destination";
    dest.location = {51.52, -0.10};
    std::vector<gd::Entity> entities = {dest};
    tracker.setEntities(&entities);

    std::vector<gd::TrackedPosition> seen;
    int discovered = 0;
    tracker.setPositionCallback([&](const gd::TrackedPosition& p) { seen.push_back(p); });
    tracker.setDiscoveryCallback([&](const gd::Entity&, double) { discovered++; });

    tracker.start();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      src.pump();
      if (src.routeFinished()) {
        src.pump();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    requireTrue(src.routeFinished(), "route finished before the deadline");

    requireTrue(seen.size() > 10, "many readings delivered");
    requireTrue(tracker.isTracking(), "tracking");
    for (std::size_t i = 1; i < seen.size(); i++) {
      requireTrue(seen[i].timestampMs - seen[i - 1].timestampMs == 1000, "one simulated second apart");
      requireTrue(seen[i].location.lat >= seen[i - 1].location.lat, "moving north");
    }
    requireTrue(seen.front().timestampMs == 1000, "first timestamp from config");
    requireTrue(seen.front().hasHeading && seen.front().headingDeg < 1.0, "heading north");
    requireTrue(std::fabs(seen.back().location.lat - 51.52) < 1e-9, "ends on the last waypoint");
    requireTrue(discovered == 1, "destination discovered once");
    requireTrue(tracker.stats().totalDistanceKm > 2.0, "distance accumulated");

    tracker.stop();
    requireTrue(!src.isRunning(), "stopped");
    std::printf("  Test 1 (route walk, %zu readings): PASS\n", seen.size());
  }

  // ---- Test 2: Queue overflow drops the oldest readings ----
  {
    gd::SimulatedRouteConfig route;
    route.maxQueued = 4;
    gd::SimulatedPositionSource src(route);

    std::vector<std::int64_t> stamps;
    src.start([&](const gd::TrackedPosition& p) { stamps.push_back(p.timestampMs); }, {});
    for (int i = 1; i <= 6; i++) {
      gd::TrackedPosition p;
      p.location = {10.0, 10.0};
      p.timestampMs = i;
      src.inject(p);
    }
    requireTrue(src.droppedEvents() == 2, "two dropped");
    requireTrue(src.pump() == 4, "four delivered");
    requireTrue(stamps.front() == 3 && stamps.back() == 6, "oldest dropped first");
    src.stop();
    std::printf("  Test 2 (overflow): PASS\n");
  }

  // ---- Test 3: Errors are queued like readings ----
  {
    gd::SimulatedPositionSource src;
    gd::LiveLocationTracker tracker(src);
    std::vector<gd::TrackerError> errors;
    tracker.setErrorCallback([&](const gd::TrackerError& e) { errors.push_back(e); });

    tracker.start();
    src.injectError(gd::PositionError{gd::PositionErrorCode::PermissionDenied, "denied"});
    src.pump();
    requireTrue(errors.size() == 1, "error delivered");
    requireTrue(errors[0].code == "POSITION_ACQUISITION_FAILED", "failed during acquisition");
    requireTrue(tracker.state() == gd::TrackerState::Idle, "idle");
    std::printf("  Test 3 (queued error): PASS\n");
  }

  std::printf("D5.5 simulated_route: ALL PASS\n");
  return 0;
}

// D5.1 - LiveLocationTracker: Idle/Acquiring/Tracking lifecycle and error paths

#include "gd/track/LiveLocationTracker.hpp"
#include "gd/track/Movement.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Synchronous source: the test decides when a reading arrives.
class FakePositionSource : public gd::PositionSource {
public:
  void start(gd::PositionCallback onUpdate, gd::PositionErrorCallback onError) override {
    onUpdate_ = std::move(onUpdate);
    onError_ = std::move(onError);
    running_ = true;
    startCount++;
  }
  void stop() override {
    running_ = false;
    stopCount++;
  }
  bool isRunning() const override { return running_; }

  void emit(const gd::TrackedPosition& p) {
    if (!running_) return;
    gd::PositionCallback cb = onUpdate_;
    if (cb) cb(p);
  }
  void fail(gd::PositionErrorCode code, const char* msg) {
    if (!running_) return;
    gd::PositionErrorCallback cb = onError_;
    if (cb) cb(gd::PositionError{code, msg});
  }

  int startCount{0};
  int stopCount{0};

private:
  bool running_{false};
  gd::PositionCallback onUpdate_;
  gd::PositionErrorCallback onError_;
};

static gd::TrackedPosition reading(double lat, double lng, std::int64_t ts) {
  gd::TrackedPosition p;
  p.location = {lat, lng};
  p.accuracyM = 10.0;
  p.timestampMs = ts;
  return p;
}

int main() {
  // ---- Test 1: Happy path ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    requireTrue(tracker.state() == gd::TrackerState::Idle, "starts idle");
    requireTrue(!tracker.hasPosition(), "no position yet");

    tracker.start();
    requireTrue(tracker.state() == gd::TrackerState::Acquiring, "acquiring after start");
    requireTrue(src.isRunning(), "source subscribed");

    int positions = 0;
    tracker.setPositionCallback([&](const gd::TrackedPosition&) { positions++; });

    src.emit(reading(51.5, -0.1, 1000));
    requireTrue(tracker.state() == gd::TrackerState::Tracking, "tracking after first fix");
    requireTrue(tracker.isTracking(), "isTracking");
    requireTrue(positions == 1, "first fix dispatched");
    requireTrue(tracker.hasPosition(), "has position");
    requireTrue(tracker.lastPosition().timestampMs == 1000, "last position stored");

    src.emit(reading(51.501, -0.1, 2000));
    requireTrue(positions == 2, "second reading dispatched");

    tracker.stop();
    requireTrue(tracker.state() == gd::TrackerState::Idle, "idle after stop");
    requireTrue(!src.isRunning(), "source unsubscribed");
    requireTrue(std::string(gd::trackerStateName(tracker.state())) == "Idle", "state name");
    std::printf("  Test 1 (lifecycle): PASS\n");
  }

  // ---- Test 2: Unusable first fix keeps acquiring ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    tracker.start();

    src.emit(reading(0.0, 0.0, 1000));
    requireTrue(tracker.state() == gd::TrackerState::Acquiring, "sentinel fix ignored");
    gd::TrackedPosition bad = reading(51.5, -0.1, 1000);
    bad.accuracyM = -1.0;
    src.emit(bad);
    requireTrue(tracker.state() == gd::TrackerState::Acquiring, "negative accuracy ignored");
    requireTrue(tracker.stats().droppedReadings == 2, "drops counted");

    src.emit(reading(51.5, -0.1, 3000));
    requireTrue(tracker.state() == gd::TrackerState::Tracking, "valid fix accepted");
    std::printf("  Test 2 (invalid first fix): PASS\n");
  }

  // ---- Test 3: Acquisition failure returns to idle without retry ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    std::vector<gd::TrackerError> errors;
    tracker.setErrorCallback([&](const gd::TrackerError& e) { errors.push_back(e); });

    tracker.start();
    src.fail(gd::PositionErrorCode::Timeout, "no fix");
    requireTrue(tracker.state() == gd::TrackerState::Idle, "idle after failure");
    requireTrue(errors.size() == 1, "one error");
    requireTrue(errors[0].code == "POSITION_ACQUISITION_FAILED", "acquisition code");
    requireTrue(errors[0].message == "no fix", "message forwarded");
    requireTrue(!src.isRunning(), "source stopped");
    requireTrue(src.startCount == 1, "no automatic retry");
    std::printf("  Test 3 (acquisition failure): PASS\n");
  }

  // ---- Test 4: Errors while tracking ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    std::vector<gd::TrackerError> errors;
    tracker.setErrorCallback([&](const gd::TrackerError& e) { errors.push_back(e); });

    tracker.start();
    src.emit(reading(51.5, -0.1, 1000));

    src.fail(gd::PositionErrorCode::Timeout, "slow gps");
    src.fail(gd::PositionErrorCode::Unavailable, "tunnel");
    requireTrue(tracker.isTracking(), "transient errors ignored");
    requireTrue(errors.empty(), "nothing surfaced");

    src.fail(gd::PositionErrorCode::PermissionDenied, "revoked");
    requireTrue(tracker.state() == gd::TrackerState::Idle, "permission loss stops");
    requireTrue(errors.size() == 1 && errors[0].code == "POSITION_PERMISSION_DENIED",
                "permission code");
    std::printf("  Test 4 (errors while tracking): PASS\n");
  }

  // ---- Test 5: Misuse of the direct update path ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);

    bool threw = false;
    try { tracker.onPositionUpdate(reading(51.5, -0.1, 1)); }
    catch (const std::logic_error&) { threw = true; }
    requireTrue(threw, "update while idle throws");

    threw = false;
    try { (void)tracker.lastPosition(); }
    catch (const std::logic_error&) { threw = true; }
    requireTrue(threw, "lastPosition without a fix throws");

    tracker.start();
    tracker.start();
    requireTrue(src.startCount == 1, "second start is a no-op");

    threw = false;
    try { tracker.onPositionUpdate(reading(51.5, -0.1, 1)); }
    catch (const std::logic_error&) { threw = true; }
    requireTrue(threw, "update while acquiring throws");

    src.emit(reading(51.5, -0.1, 1000));
    bool nestedThrew = false;
    tracker.setPositionCallback([&](const gd::TrackedPosition&) {
      try { tracker.onPositionUpdate(reading(51.6, -0.1, 5000)); }
      catch (const std::logic_error&) { nestedThrew = true; }
    });
    tracker.onPositionUpdate(reading(51.501, -0.1, 2000));
    requireTrue(nestedThrew, "update from inside a callback throws");
    requireTrue(tracker.history().size() == 2, "nested reading not applied");
    std::printf("  Test 5 (misuse): PASS\n");
  }

  // ---- Test 6: Bounded history and reading hygiene ----
  {
    FakePositionSource src;
    gd::TrackerConfig cfg;
    cfg.historySize = 5;
    gd::LiveLocationTracker tracker(src, cfg);
    tracker.start();

    for (int i = 0; i < 8; i++) {
      src.emit(reading(51.5 + i * 0.001, -0.1, 1000 + i * 1000));
    }
    requireTrue(tracker.history().size() == 5, "history capped");
    requireTrue(tracker.history().front().timestampMs == 4000, "oldest evicted");
    requireTrue(tracker.stats().readingCount == 8, "all readings counted");

    src.emit(reading(51.6, -0.1, 500));
    requireTrue(tracker.lastPosition().timestampMs == 8000, "out-of-order reading dropped");

    gd::TrackedPosition odd = reading(51.51, -0.1, 9000);
    odd.hasSpeed = true;
    odd.speedMps = -4.0;
    odd.hasHeading = true;
    odd.headingDeg = -90.0;
    src.emit(odd);
    requireTrue(!tracker.lastPosition().hasSpeed, "negative speed discarded");
    requireTrue(tracker.lastPosition().headingDeg == 270.0, "heading normalized");
    std::printf("  Test 6 (history + hygiene): PASS\n");
  }

  // ---- Test 7: Movement descriptions ----
  {
    using gd::MovementDirection;
    requireTrue(gd::movementDirection(false, 10.0) == MovementDirection::Unknown, "no heading");
    requireTrue(gd::movementDirection(true, 350.0) == MovementDirection::North, "350 north");
    requireTrue(gd::movementDirection(true, 44.9) == MovementDirection::North, "44.9 north");
    requireTrue(gd::movementDirection(true, 45.0) == MovementDirection::East, "45 east");
    requireTrue(gd::movementDirection(true, 180.0) == MovementDirection::South, "180 south");
    requireTrue(gd::movementDirection(true, -60.0) == MovementDirection::West, "-60 west");
    requireTrue(std::string(gd::directionName(MovementDirection::East)) == "east", "name");
    requireTrue(std::string(gd::directionName(MovementDirection::Unknown)) == "unknown",
                "unknown name");

    requireTrue(gd::speedClass(false, 3.0) == gd::SpeedClass::Stationary, "no speed");
    requireTrue(gd::speedClass(true, 0.3) == gd::SpeedClass::Walking, "0.3 walking");
    requireTrue(gd::speedClass(true, 1.4) == gd::SpeedClass::Slow, "1.4 slow");
    requireTrue(gd::speedClass(true, 4.0) == gd::SpeedClass::Moving, "4 moving");
    requireTrue(gd::speedClass(true, 8.0) == gd::SpeedClass::Fast, "8 fast");
    requireTrue(gd::speedClass(true, 30.0) == gd::SpeedClass::VeryFast, "30 very fast");
    requireTrue(std::string(gd::speedDescription(gd::SpeedClass::Fast)) == "Fast movement",
                "description");
    std::printf("  Test 7 (movement): PASS\n");
  }

  std::printf("D5.1 tracker_states: ALL PASS\n");
  return 0;
}

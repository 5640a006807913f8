// D5.2 - LiveLocationTracker discovery: once per session, restart resets

#include "gd/track/LiveLocationTracker.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

class FakePositionSource : public gd::PositionSource {
public:
  void start(gd::PositionCallback onUpdate, gd::PositionErrorCallback onError) override {
    onUpdate_ = std::move(onUpdate);
    onError_ = std::move(onError);
    running_ = true;
  }
  void stop() override { running_ = false; }
  bool isRunning() const override { return running_; }

  void emit(const gd::TrackedPosition& p) {
    if (!running_) return;
    gd::PositionCallback cb = onUpdate_;
    if (cb) cb(p);
  }

private:
  bool running_{false};
  gd::PositionCallback onUpdate_;
  gd::PositionErrorCallback onError_;
};

static gd::Entity makeEntity(const char* id, double lat, double lng) {
  gd::Entity e;
  e.id = id;
  e.name = id;
  e.location = {lat, lng};
  return e;
}

static gd::TrackedPosition reading(double lat, double lng, std::int64_t ts) {
  gd::TrackedPosition p;
  p.location = {lat, lng};
  p.accuracyM = 5.0;
  p.timestampMs = ts;
  return p;
}

int main() {
  // Base point; 0.009 deg latitude is ~1 km.
  const double lat0 = 51.5, lng0 = -0.1;
  std::vector<gd::Entity> entities = {
    makeEntity("shop", lat0 + 0.009, lng0),   // ~1 km
    makeEntity("farm", lat0 + 0.18, lng0),    // ~20 km
    makeEntity("ghost", 0.0, 0.0),            // unlocatable
  };

  // ---- Test 1: Fires exactly once while the entity stays in range ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    tracker.setEntities(&entities);

    std::vector<std::string> fired;
    std::vector<double> distances;
    tracker.setDiscoveryCallback([&](const gd::Entity& e, double km) {
      fired.push_back(e.id);
      distances.push_back(km);
    });

    tracker.start();
    src.emit(reading(lat0, lng0, 1000));
    requireTrue(fired.size() == 1 && fired[0] == "shop", "shop discovered on first fix");
    requireClose(distances[0], 1.0, 0.01, "distance reported");
    requireTrue(tracker.nearby().size() == 1, "one nearby");
    requireTrue(tracker.nearby()[0].newlyDiscovered, "flagged new");

    for (int i = 1; i <= 10; i++) {
      src.emit(reading(lat0 + i * 0.0001, lng0, 1000 + i * 1000));
    }
    requireTrue(fired.size() == 1, "no re-fire while in range");
    requireTrue(tracker.nearby().size() == 1, "still listed as nearby");
    requireTrue(!tracker.nearby()[0].newlyDiscovered, "no longer new");
    requireTrue(tracker.isDiscovered("shop"), "recorded");
    requireTrue(!tracker.isDiscovered("farm"), "farm not recorded");
    requireTrue(tracker.stats().entitiesDiscovered == 1, "stats count");
    std::printf("  Test 1 (fires once): PASS\n");
  }

  // ---- Test 2: Leaving and re-entering range does not re-fire ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    tracker.setEntities(&entities);
    int fired = 0;
    tracker.setDiscoveryCallback([&](const gd::Entity&, double) { fired++; });

    tracker.start();
    src.emit(reading(lat0, lng0, 1000));
    src.emit(reading(lat0 - 0.05, lng0, 2000));   // ~6.5 km from shop
    requireTrue(tracker.nearby().empty(), "nothing nearby away from shop");
    src.emit(reading(lat0, lng0, 3000));
    requireTrue(fired == 1, "re-entry does not re-fire");
    requireTrue(tracker.nearby().size() == 1, "shop nearby again");
    std::printf("  Test 2 (re-entry): PASS\n");
  }

  // ---- Test 3: stop/start keeps the record, restart clears it ----
  {
    FakePositionSource src;
    gd::LiveLocationTracker tracker(src);
    tracker.setEntities(&entities);
    int fired = 0;
    tracker.setDiscoveryCallback([&](const gd::Entity&, double) { fired++; });

    tracker.start();
    src.emit(reading(lat0, lng0, 1000));
    tracker.stop();
    tracker.start();
    src.emit(reading(lat0, lng0, 2000));
    requireTrue(fired == 1, "record survives stop/start");
    requireTrue(tracker.stats().entitiesDiscovered == 1, "count survives stop/start");

    tracker.restart();
    requireTrue(tracker.state() == gd::TrackerState::Acquiring, "restart re-acquires");
    requireTrue(tracker.discoveredCount() == 0, "record cleared");
    src.emit(reading(lat0, lng0, 3000));
    requireTrue(fired == 2, "fires again after restart");

    tracker.resetDiscoveries();
    src.emit(reading(lat0, lng0, 4000));
    requireTrue(fired == 3, "fires again after explicit reset");
    std::printf("  Test 3 (restart semantics): PASS\n");
  }

  // ---- Test 4: Records are per tracker ----
  {
    FakePositionSource srcA, srcB;
    gd::LiveLocationTracker a(srcA), b(srcB);
    a.setEntities(&entities);
    b.setEntities(&entities);
    int firedA = 0, firedB = 0;
    a.setDiscoveryCallback([&](const gd::Entity&, double) { firedA++; });
    b.setDiscoveryCallback([&](const gd::Entity&, double) { firedB++; });

    a.start();
    b.start();
    srcA.emit(reading(lat0, lng0, 1000));
    srcB.emit(reading(lat0, lng0, 1000));
    requireTrue(firedA == 1 && firedB == 1, "independent records");
    std::printf("  Test 4 (independent sessions): PASS\n");
  }

  // ---- Test 5: Nearby list capped, every entity still discovered ----
  {
    std::vector<gd::Entity> cluster;
    for (int i = 0; i < 6; i++) {
      std::string id = "p" + std::to_string(i);
      gd::Entity e;
      e.id = id;
      e.location = {lat0 + 0.001 * (i + 1), lng0};
      cluster.push_back(e);
    }

    FakePositionSource src;
    gd::TrackerConfig cfg;
    cfg.maxNearby = 3;
    gd::LiveLocationTracker tracker(src, cfg);
    tracker.setEntities(&cluster);
    std::vector<std::string> fired;
    tracker.setDiscoveryCallback([&](const gd::Entity& e, double) { fired.push_back(e.id); });

    tracker.start();
    src.emit(reading(lat0, lng0, 1000));
    requireTrue(tracker.nearby().size() == 3, "nearby capped");
    requireTrue(tracker.nearby()[0].entity.id == "p0", "nearest first");
    requireTrue(fired.size() == 6, "all six discovered");
    requireTrue(fired[0] == "p0" && fired[5] == "p5", "discovered nearest first");

    // ~111 m at walking pace (3 km/h) rounds to 2 minutes.
    requireClose(tracker.nearby()[0].etaMinutes, 2.0, 1e-9, "walking eta");
    std::printf("  Test 5 (nearby cap): PASS\n");
  }

  // ---- Test 6: Radius boundary and entity list swap ----
  {
    FakePositionSource src;
    gd::TrackerConfig cfg;
    cfg.discoveryRadiusKm = 25.0;
    gd::LiveLocationTracker tracker(src, cfg);
    int fired = 0;
    tracker.setDiscoveryCallback([&](const gd::Entity&, double) { fired++; });

    tracker.start();
    src.emit(reading(lat0, lng0, 1000));
    requireTrue(fired == 0, "no entities, no events");

    tracker.setEntities(&entities);
    src.emit(reading(lat0, lng0, 2000));
    requireTrue(fired == 2, "shop and farm within 25 km");
    requireTrue(!tracker.isDiscovered("ghost"), "unlocatable never discovered");
    std::printf("  Test 6 (radius + entity swap): PASS\n");
  }

  std::printf("D5.2 discovery_dedup: ALL PASS\n");
  return 0;
}

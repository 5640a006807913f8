// Discovery demo
// Walks a simulated route through a small set of farms, prints discoveries,
// re-clusters the viewport as the camera follows the walker and flies to
// the first cluster it sees.
// Use --entities <file.json> and --config <file.json> to override the
// built-in data and engine settings.

#include "gd/cluster/ClusterTier.hpp"
#include "gd/config/EngineConfig.hpp"
#include "gd/entity/EntityStore.hpp"
#include "gd/session/MapSession.hpp"
#include "gd/track/Movement.hpp"
#include "gd/track/SimulatedPositionSource.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

static const char* kDefaultEntities = R"({"entities":[
  {"id":"oak-farm","name":"Oak Farm","lat":51.5030,"lng":-0.1050,"tags":["eggs"]},
  {"id":"hill-dairy","name":"Hill Dairy","lat":51.5105,"lng":-0.1010,"tags":["milk"]},
  {"id":"mill-barn","name":"Mill Barn","lat":51.5122,"lng":-0.0985,"tags":["flour"]},
  {"id":"river-orchard","name":"River Orchard","lat":51.5300,"lng":-0.0900,"tags":["apples"]},
  {"id":"far-fields","name":"Far Fields","lat":51.6500,"lng":-0.3000,"tags":["veg"]},
  {"id":"unmapped","name":"Unmapped Stall","lat":0,"lng":0}
]})";

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static double nowMs() {
  using namespace std::chrono;
  return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

int main(int argc, char* argv[]) {
  std::string entitiesPath, configPath;
  for (int i = 1; i < argc; i++) {
    if (std::string(argv[i]) == "--entities" && i + 1 < argc) {
      entitiesPath = argv[++i];
    } else if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    }
  }

  // 1. Engine settings
  gd::EngineConfig cfg;
  if (!configPath.empty()) {
    std::string json;
    if (!readFile(configPath, json) || !gd::deserializeEngineConfig(json, cfg)) {
      std::fprintf(stderr, "Cannot use config %s\n", configPath.c_str());
      return 1;
    }
  }

  // 2. Entities
  gd::EntityStore store;
  store.setDataQualityCallback([](const gd::DataQualityIssue& i) {
    std::printf("[data] %s %s: %s\n", i.code.c_str(), i.entityId.c_str(), i.message.c_str());
  });
  std::string entitiesJson = kDefaultEntities;
  if (!entitiesPath.empty() && !readFile(entitiesPath, entitiesJson)) {
    std::fprintf(stderr, "Cannot read %s\n", entitiesPath.c_str());
    return 1;
  }
  if (!store.loadJSON(entitiesJson)) {
    std::fprintf(stderr, "Malformed entity document\n");
    return 1;
  }
  std::printf("Loaded %zu entities (%zu unlocatable)\n", store.count(), store.unlocatableCount());

  // 3. Simulated walk, 60x real time
  gd::SimulatedRouteConfig route;
  route.waypoints = {{51.4990, -0.1100}, {51.5110, -0.1000}, {51.5290, -0.0910}};
  route.speedMps = 1.4;
  route.intervalMs = 50;
  route.timeScale = 60.0;
  gd::SimulatedPositionSource source(route);

  gd::MapSession session(store, source, cfg);
  session.setCameraSink([](const gd::CameraState&) {});

  session.tracker().setDiscoveryCallback([](const gd::Entity& e, double km) {
    std::printf("[discover] %s (%.2f km)\n", e.name.c_str(), km);
  });
  session.tracker().setErrorCallback([](const gd::TrackerError& e) {
    std::printf("[error] %s: %s\n", e.code.c_str(), e.message.c_str());
  });

  bool flewToCluster = false;
  std::size_t lastReport = 0;
  session.tracker().setPositionCallback([&](const gd::TrackedPosition& p) {
    // Follow the walker unless a selection is animating.
    session.onCameraMoved({p.location, 14.0});
    gd::GeoBounds view{p.location.lng - 0.02, p.location.lat - 0.01,
                       p.location.lng + 0.02, p.location.lat + 0.01};
    if (session.onViewportChange(view, 14.0) && !flewToCluster) {
      for (const auto& c : session.renderSet().clusters) {
        if (c.isSingleton()) continue;
        gd::ClusterTier tier = gd::clusterTier(c.size());
        std::printf("[cluster] %s marker \"%s\" at (%.4f, %.4f)\n", gd::tierName(tier),
                    gd::formatClusterCount(c.size()).c_str(), c.centroid.lat, c.centroid.lng);
        session.selectCluster(c, nowMs(), [](gd::TransitionId id, bool cancelled) {
          std::printf("[camera] transition %llu %s\n",
                      static_cast<unsigned long long>(id), cancelled ? "cancelled" : "arrived");
        });
        flewToCluster = true;
        break;
      }
    }

    const gd::TrackingStats& s = session.tracker().stats();
    if (s.readingCount >= lastReport + 50) {
      lastReport = s.readingCount;
      std::printf("[track] %.3f km, %.1f km/h, heading %s, %s\n",
                  s.totalDistanceKm, s.averageSpeedKmh,
                  gd::directionName(gd::movementDirection(p.hasHeading, p.headingDeg)),
                  gd::speedDescription(gd::speedClass(p.hasSpeed, p.speedMps)));
    }
  });

  // 4. Host loop
  session.startTracking();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(120);
  while (std::chrono::steady_clock::now() < deadline) {
    source.pump();
    session.advance(nowMs());
    if (source.routeFinished()) {
      source.pump();
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(16));
  }

  const gd::TrackingStats& s = session.tracker().stats();
  std::printf("Walked %.3f km in %.1f min, %zu readings, %zu entities discovered\n",
              s.totalDistanceKm, s.durationMs / 60000.0, s.readingCount, s.entitiesDiscovered);

  if (session.tracker().hasPosition()) {
    gd::DistanceRanker ranker(cfg.rank);
    for (const auto& r : session.nearest(session.tracker().lastPosition().location)) {
      std::printf("  %-16s %6.2f km  ~%.0f min walk\n", r.entity->name.c_str(), r.distanceKm,
                  ranker.estimateArrivalMinutes(r.distanceKm));
    }
  }

  session.stopTracking();
  return 0;
}

#include "gd/track/SimulatedPositionSource.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace gd {

SimulatedPositionSource::SimulatedPositionSource()
    : SimulatedPositionSource(SimulatedRouteConfig{}) {}

SimulatedPositionSource::SimulatedPositionSource(const SimulatedRouteConfig& config)
    : config_(config), queue_(config.maxQueued) {}

SimulatedPositionSource::~SimulatedPositionSource() { stop(); }

void SimulatedPositionSource::start(PositionCallback onUpdate,
                                    PositionErrorCallback onError) {
  if (running_.load()) return;
  onUpdate_ = std::move(onUpdate);
  onError_ = std::move(onError);
  generation_++;
  queue_.clear();
  finished_.store(false);
  running_.store(true);
  if (!config_.waypoints.empty()) {
    thread_ = std::thread(&SimulatedPositionSource::producerLoop, this);
  }
}

void SimulatedPositionSource::stop() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
  queue_.clear();
  // Bumping the generation makes an in-progress pump() stop delivering.
  generation_++;
}

bool SimulatedPositionSource::isRunning() const { return running_.load(); }

void SimulatedPositionSource::inject(const TrackedPosition& reading) {
  if (!running_.load()) return;
  Event ev;
  ev.reading = reading;
  queue_.push(std::move(ev));
}

void SimulatedPositionSource::injectError(const PositionError& error) {
  if (!running_.load()) return;
  Event ev;
  ev.isError = true;
  ev.error = error;
  queue_.push(std::move(ev));
}

std::size_t SimulatedPositionSource::pump() {
  if (!running_.load()) return 0;

  std::vector<Event> events = queue_.drain();
  const std::uint64_t gen = generation_;
  std::size_t delivered = 0;

  for (const auto& ev : events) {
    if (!running_.load() || gen != generation_) break;
    // Copies: the callback may stop() or restart() this source.
    if (ev.isError) {
      PositionErrorCallback cb = onError_;
      if (cb) { cb(ev.error); delivered++; }
    } else {
      PositionCallback cb = onUpdate_;
      if (cb) { cb(ev.reading); delivered++; }
    }
  }
  return delivered;
}

TrackedPosition SimulatedPositionSource::sampleRoute(double travelledM, bool& atEnd) const {
  const auto& wp = config_.waypoints;
  TrackedPosition p;
  p.accuracyM = config_.accuracyM;
  p.hasSpeed = true;
  p.speedMps = config_.speedMps;
  atEnd = false;

  if (wp.size() == 1) {
    p.location = wp[0];
    p.speedMps = 0.0;
    atEnd = true;
    return p;
  }

  double remaining = travelledM;
  for (std::size_t i = 0; i + 1 < wp.size(); i++) {
    double segM = distanceKm(wp[i], wp[i + 1]) * 1000.0;
    if (remaining <= segM || i + 2 == wp.size()) {
      double t = segM > 0.0 ? std::min(1.0, remaining / segM) : 1.0;
      p.location.lat = wp[i].lat + (wp[i + 1].lat - wp[i].lat) * t;
      p.location.lng = wp[i].lng + (wp[i + 1].lng - wp[i].lng) * t;
      p.hasHeading = segM > 0.0;
      p.headingDeg = p.hasHeading ? bearingDeg(wp[i], wp[i + 1]) : 0.0;
      if (i + 2 == wp.size() && t >= 1.0) {
        atEnd = true;
        p.speedMps = 0.0;
      }
      return p;
    }
    remaining -= segM;
  }
  return p;
}

void SimulatedPositionSource::producerLoop() {
  using Clock = std::chrono::steady_clock;

  const double stepSimS = config_.intervalMs / 1000.0 * config_.timeScale;
  const double stepM = config_.speedMps * stepSimS;

  auto nextTick = Clock::now();
  double travelled = 0.0;
  std::int64_t tick = 0;

  while (running_.load()) {
    bool atEnd = false;
    TrackedPosition p = sampleRoute(travelled, atEnd);
    p.timestampMs = config_.startTimestampMs +
        static_cast<std::int64_t>(std::llround(static_cast<double>(tick) * stepSimS * 1000.0));

    Event ev;
    ev.reading = p;
    queue_.push(std::move(ev));
    tick++;

    if (atEnd) {
      if (!config_.loop) {
        finished_.store(true);
        break;
      }
      travelled = 0.0;
    } else {
      travelled += stepM;
    }

    nextTick += std::chrono::milliseconds(config_.intervalMs);
    std::this_thread::sleep_until(nextTick);
  }
}

} // namespace gd

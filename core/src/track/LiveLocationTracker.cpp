#include "gd/track/LiveLocationTracker.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace gd {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kKmPerDegree = 111.32;

// Restores the previous flag so nested dispatches unwind correctly.
struct DispatchScope {
  bool& flag;
  bool prev;
  explicit DispatchScope(bool& f) : flag(f), prev(f) { flag = true; }
  ~DispatchScope() { flag = prev; }
};

RankConfig rankConfigFor(const TrackerConfig& cfg) {
  RankConfig rc;
  rc.includeUnlocatable = false;
  rc.walkingSpeedKmh = cfg.walkingSpeedKmh;
  return rc;
}

} // namespace

const char* trackerStateName(TrackerState s) {
  switch (s) {
    case TrackerState::Idle:      return "Idle";
    case TrackerState::Acquiring: return "Acquiring";
    case TrackerState::Tracking:  return "Tracking";
  }
  return "Idle";
}

LiveLocationTracker::LiveLocationTracker(PositionSource& source)
    : LiveLocationTracker(source, TrackerConfig{}) {}

LiveLocationTracker::LiveLocationTracker(PositionSource& source, const TrackerConfig& cfg)
    : source_(source) {
  setConfig(cfg);
}

LiveLocationTracker::~LiveLocationTracker() {
  if (state_ != TrackerState::Idle) {
    state_ = TrackerState::Idle;
    session_++;
    source_.stop();
  }
}

void LiveLocationTracker::setConfig(const TrackerConfig& cfg) {
  config_ = cfg;
  if (config_.historySize < 1) config_.historySize = 1;
  ranker_.setConfig(rankConfigFor(config_));
}

void LiveLocationTracker::start() {
  if (state_ != TrackerState::Idle) return;

  state_ = TrackerState::Acquiring;
  session_++;

  history_.clear();
  nearby_.clear();
  prediction_ = PredictedPosition{};
  stats_ = TrackingStats{};
  stats_.entitiesDiscovered = discovered_.size();
  startTimestampMs_ = 0;

  const std::uint64_t session = session_;
  source_.start(
    [this, session](const TrackedPosition& r) { handleSourceUpdate(session, r); },
    [this, session](const PositionError& e) { handleSourceError(session, e); });
}

void LiveLocationTracker::stop() {
  if (state_ == TrackerState::Idle) return;
  state_ = TrackerState::Idle;
  session_++;
  source_.stop();
}

void LiveLocationTracker::restart() {
  stop();
  resetDiscoveries();
  start();
}

void LiveLocationTracker::resetDiscoveries() {
  discovered_.clear();
  stats_.entitiesDiscovered = 0;
}

const TrackedPosition& LiveLocationTracker::lastPosition() const {
  if (history_.empty()) {
    throw std::logic_error("LiveLocationTracker: no position received yet");
  }
  return history_.back();
}

bool LiveLocationTracker::isDiscovered(const std::string& entityId) const {
  return discovered_.count(entityId) != 0;
}

bool LiveLocationTracker::sanitize(const TrackedPosition& in, TrackedPosition& out) const {
  if (!isValidCoordinate(in.location)) return false;
  if (!std::isfinite(in.accuracyM) || in.accuracyM < 0.0) return false;
  if (!history_.empty() && in.timestampMs < history_.back().timestampMs) return false;

  out = in;
  if (out.hasSpeed && (!std::isfinite(out.speedMps) || out.speedMps < 0.0)) {
    out.hasSpeed = false;
    out.speedMps = 0.0;
  }
  if (out.hasHeading) {
    if (!std::isfinite(out.headingDeg)) {
      out.hasHeading = false;
      out.headingDeg = 0.0;
    } else {
      out.headingDeg = std::fmod(out.headingDeg, 360.0);
      if (out.headingDeg < 0.0) out.headingDeg += 360.0;
    }
  }
  return true;
}

void LiveLocationTracker::handleSourceUpdate(std::uint64_t session,
                                             const TrackedPosition& reading) {
  if (session != session_) return; // delivered after stop()

  if (state_ == TrackerState::Acquiring) {
    TrackedPosition clean;
    if (!sanitize(reading, clean)) {
      stats_.droppedReadings++;
      return;
    }
    state_ = TrackerState::Tracking;
    startTimestampMs_ = clean.timestampMs;
    auto fresh = apply(clean);
    dispatch(clean, fresh);
    return;
  }

  if (state_ == TrackerState::Tracking) onPositionUpdate(reading);
}

void LiveLocationTracker::handleSourceError(std::uint64_t session, const PositionError& error) {
  if (session != session_) return;

  if (state_ == TrackerState::Acquiring) {
    std::fprintf(stderr, "LiveLocationTracker: position acquisition failed: %s\n",
                 error.message.c_str());
    stop();
    fail("POSITION_ACQUISITION_FAILED", error.message);
    return;
  }

  if (state_ == TrackerState::Tracking &&
      error.code == PositionErrorCode::PermissionDenied) {
    std::fprintf(stderr, "LiveLocationTracker: permission revoked while tracking: %s\n",
                 error.message.c_str());
    stop();
    fail("POSITION_PERMISSION_DENIED", error.message);
  }
  // Timeouts and temporary unavailability while tracking are sensor noise.
}

void LiveLocationTracker::onPositionUpdate(const TrackedPosition& reading) {
  if (state_ != TrackerState::Tracking) {
    throw std::logic_error("LiveLocationTracker: position update while not tracking");
  }
  if (dispatching_) {
    throw std::logic_error("LiveLocationTracker: position update re-entered from a callback");
  }

  TrackedPosition clean;
  if (!sanitize(reading, clean)) {
    stats_.droppedReadings++;
    return;
  }
  auto fresh = apply(clean);
  dispatch(clean, fresh);
}

std::vector<NearbyEntity> LiveLocationTracker::apply(const TrackedPosition& reading) {
  if (!history_.empty()) {
    stats_.totalDistanceKm += distanceKm(history_.back().location, reading.location);
  }
  history_.push_back(reading);
  while (history_.size() > config_.historySize) history_.pop_front();

  stats_.readingCount++;
  stats_.durationMs = std::max<std::int64_t>(0, reading.timestampMs - startTimestampMs_);
  double hours = static_cast<double>(stats_.durationMs) / 3600000.0;
  stats_.averageSpeedKmh = hours > 0.0 ? stats_.totalDistanceKm / hours : 0.0;

  updatePrediction(reading);

  std::vector<NearbyEntity> fresh;
  nearby_.clear();
  if (entities_) {
    double speed = reading.hasSpeed ? reading.speedMps : 0.0;
    for (const auto& r : ranker_.rank(*entities_, reading.location)) {
      if (!r.locatable || r.distanceKm > config_.discoveryRadiusKm) break;

      NearbyEntity n;
      n.entity = *r.entity;
      n.distanceKm = r.distanceKm;
      n.etaMinutes = ranker_.estimateArrivalMinutes(r.distanceKm, speed);
      n.newlyDiscovered = discovered_.insert(n.entity.id).second;

      if (n.newlyDiscovered) fresh.push_back(n);
      if (nearby_.size() < config_.maxNearby) nearby_.push_back(std::move(n));
    }
  }
  stats_.entitiesDiscovered = discovered_.size();
  return fresh;
}

void LiveLocationTracker::updatePrediction(const TrackedPosition& reading) {
  prediction_ = PredictedPosition{};
  if (!reading.hasSpeed || !reading.hasHeading) return;

  double cosLat = std::cos(reading.location.lat * kPi / 180.0);
  if (std::fabs(cosLat) < 1e-6) return;

  // Equirectangular small-angle step along the current heading.
  double aheadS = config_.lookAheadMinutes * 60.0;
  double aheadKm = reading.speedMps * aheadS / 1000.0;
  double h = reading.headingDeg * kPi / 180.0;

  double lat = reading.location.lat + aheadKm * std::cos(h) / kKmPerDegree;
  double lng = reading.location.lng + aheadKm * std::sin(h) / (kKmPerDegree * cosLat);

  prediction_.valid = true;
  prediction_.location.lat = std::max(-90.0, std::min(90.0, lat));
  prediction_.location.lng = normalizeLongitude(lng);
  prediction_.timestampMs = reading.timestampMs + static_cast<std::int64_t>(aheadS * 1000.0);
}

void LiveLocationTracker::dispatch(const TrackedPosition& reading,
                                   const std::vector<NearbyEntity>& fresh) {
  DispatchScope scope(dispatching_);
  const std::uint64_t session = session_;

  // Copies so a callback may replace its own handler.
  TrackerPositionCallback onPosition = onPosition_;
  DiscoveryCallback onDiscovered = onDiscovered_;

  if (onPosition) onPosition(reading);

  for (std::size_t i = 0; i < fresh.size(); i++) {
    if (session != session_) {
      // Undelivered discoveries stay eligible for the next session.
      for (std::size_t j = i; j < fresh.size(); j++) discovered_.erase(fresh[j].entity.id);
      stats_.entitiesDiscovered = discovered_.size();
      break;
    }
    if (onDiscovered) onDiscovered(fresh[i].entity, fresh[i].distanceKm);
  }
}

void LiveLocationTracker::fail(const char* code, const std::string& message) {
  TrackerErrorCallback onError = onError_;
  if (onError) onError(TrackerError{code, message});
}

} // namespace gd

#pragma once
#include "gd/geo/Types.hpp"
#include "gd/rank/DistanceRanker.hpp"
#include "gd/track/PositionSource.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gd {

enum class TrackerState : std::uint8_t { Idle, Acquiring, Tracking };

const char* trackerStateName(TrackerState s);

struct TrackerConfig {
  double discoveryRadiusKm{2.0};
  double lookAheadMinutes{5.0};
  std::size_t historySize{50};
  std::size_t maxNearby{10};
  double walkingSpeedKmh{3.0};
};

struct TrackerError {
  std::string code;     // "POSITION_ACQUISITION_FAILED", "POSITION_PERMISSION_DENIED"
  std::string message;
};

struct NearbyEntity {
  Entity entity;
  double distanceKm{0};
  double etaMinutes{0};
  bool newlyDiscovered{false};
};

struct PredictedPosition {
  bool valid{false};
  Coordinate location;
  std::int64_t timestampMs{0};  // reading time + look-ahead
};

struct TrackingStats {
  double totalDistanceKm{0};
  double averageSpeedKmh{0};
  std::size_t entitiesDiscovered{0};
  std::int64_t durationMs{0};
  std::size_t readingCount{0};
  std::size_t droppedReadings{0};
};

using DiscoveryCallback    = std::function<void(const Entity&, double distanceKm)>;
using TrackerErrorCallback = std::function<void(const TrackerError&)>;
using TrackerPositionCallback = std::function<void(const TrackedPosition&)>;

// Idle -> Acquiring -> Tracking -> Idle.
//
// Each accepted reading is applied in full (history, stats, prediction,
// nearby list, discovery record) before any callback runs. stop(),
// restart() and resetDiscoveries() may be called from inside those
// callbacks; once stop() returns nothing further is delivered for the
// stopped session, and entities whose discovery event was not delivered
// are removed from the record again. The discovery record survives
// stop()/start() and is cleared only by restart() or resetDiscoveries().
class LiveLocationTracker {
public:
  explicit LiveLocationTracker(PositionSource& source);
  LiveLocationTracker(PositionSource& source, const TrackerConfig& cfg);
  ~LiveLocationTracker();

  LiveLocationTracker(const LiveLocationTracker&) = delete;
  LiveLocationTracker& operator=(const LiveLocationTracker&) = delete;

  void setConfig(const TrackerConfig& cfg);
  const TrackerConfig& config() const { return config_; }

  // Not owned; must outlive the tracker or be replaced before it changes.
  void setEntities(const std::vector<Entity>* entities) { entities_ = entities; }

  void setDiscoveryCallback(DiscoveryCallback cb) { onDiscovered_ = std::move(cb); }
  void setErrorCallback(TrackerErrorCallback cb) { onError_ = std::move(cb); }
  void setPositionCallback(TrackerPositionCallback cb) { onPosition_ = std::move(cb); }

  void start();
  void stop();
  void restart();
  void resetDiscoveries();

  // Applies one reading. Only valid while Tracking and outside a dispatch;
  // anything else is an integration bug and throws std::logic_error.
  // A malformed reading is dropped silently.
  void onPositionUpdate(const TrackedPosition& reading);

  TrackerState state() const { return state_; }
  bool isTracking() const { return state_ == TrackerState::Tracking; }

  const std::deque<TrackedPosition>& history() const { return history_; }
  bool hasPosition() const { return !history_.empty(); }
  // Throws std::logic_error when hasPosition() is false.
  const TrackedPosition& lastPosition() const;

  const PredictedPosition& prediction() const { return prediction_; }
  const std::vector<NearbyEntity>& nearby() const { return nearby_; }
  const TrackingStats& stats() const { return stats_; }

  bool isDiscovered(const std::string& entityId) const;
  std::size_t discoveredCount() const { return discovered_.size(); }

private:
  void handleSourceUpdate(std::uint64_t session, const TrackedPosition& reading);
  void handleSourceError(std::uint64_t session, const PositionError& error);

  bool sanitize(const TrackedPosition& in, TrackedPosition& out) const;
  std::vector<NearbyEntity> apply(const TrackedPosition& reading);
  void updatePrediction(const TrackedPosition& reading);
  void dispatch(const TrackedPosition& reading, const std::vector<NearbyEntity>& fresh);
  void fail(const char* code, const std::string& message);

  PositionSource& source_;
  TrackerConfig config_;
  DistanceRanker ranker_;
  const std::vector<Entity>* entities_{nullptr};

  TrackerState state_{TrackerState::Idle};
  std::uint64_t session_{0};
  bool dispatching_{false};

  std::deque<TrackedPosition> history_;
  std::int64_t startTimestampMs_{0};
  PredictedPosition prediction_;
  std::vector<NearbyEntity> nearby_;
  TrackingStats stats_;
  std::unordered_set<std::string> discovered_;

  DiscoveryCallback onDiscovered_;
  TrackerErrorCallback onError_;
  TrackerPositionCallback onPosition_;
};

} // namespace gd

#include "gd/camera/TransitionController.hpp"
#include "gd/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gd {

static bool finiteState(const CameraState& s) {
  return std::isfinite(s.center.lat) && std::isfinite(s.center.lng) &&
         std::isfinite(s.zoom);
}

TransitionId TransitionController::transitionTo(const CameraState& target, double nowMs,
                                                TransitionCompleteCallback onComplete) {
  return transitionTo(target, config_.durationMs, nowMs, std::move(onComplete));
}

TransitionId TransitionController::transitionTo(const CameraState& target, double durationMs,
                                                double nowMs,
                                                TransitionCompleteCallback onComplete) {
  if (!std::isfinite(durationMs) || durationMs < 0.0) {
    throw std::invalid_argument("TransitionController: duration must be finite and >= 0");
  }
  if (!finiteState(target) || !std::isfinite(nowMs)) {
    throw std::invalid_argument("TransitionController: non-finite target or timestamp");
  }

  // Retarget from wherever the camera is right now. Partially applied
  // state of the pre-empted transition is kept, not rolled back.
  Transition preempted;
  bool hadPrev = active_;
  if (active_) {
    camera_ = sample(nowMs);
    preempted = std::move(current_);
    active_ = false;
  }

  Transition next;
  next.id = nextId_++;
  next.start = camera_;
  next.target = target;
  next.startMs = nowMs;
  next.durationMs = durationMs;
  next.easing = config_.easing;
  next.onComplete = std::move(onComplete);

  current_ = std::move(next);
  active_ = true;
  const TransitionId id = current_.id;

  if (hadPrev) {
    publish();
    if (preempted.onComplete) preempted.onComplete(preempted.id, true);
  }
  return id;
}

double TransitionController::progressAt(double nowMs) const {
  if (!active_) return 1.0;
  if (current_.durationMs <= 0.0) return 1.0;
  double p = (nowMs - current_.startMs) / current_.durationMs;
  if (!(p > 0.0)) return 0.0;
  return std::min(1.0, p);
}

CameraState TransitionController::interpolate(const CameraState& a, const CameraState& b,
                                              double e) {
  CameraState s;
  s.center.lat = a.center.lat + (b.center.lat - a.center.lat) * e;
  s.zoom = a.zoom + (b.zoom - a.zoom) * e;

  // Shortest way round for longitude.
  double dLng = b.center.lng - a.center.lng;
  if (dLng > 180.0) dLng -= 360.0;
  if (dLng < -180.0) dLng += 360.0;
  s.center.lng = normalizeLongitude(a.center.lng + dLng * e);
  return s;
}

CameraState TransitionController::sample(double nowMs) const {
  if (!active_) return camera_;
  double p = progressAt(nowMs);
  if (p >= 1.0) return current_.target;
  return interpolate(current_.start, current_.target, applyEasing(current_.easing, p));
}

CameraFrame TransitionController::advance(double nowMs) {
  CameraFrame frame;
  if (!active_) {
    frame.camera = camera_;
    return frame;
  }

  double p = progressAt(nowMs);
  camera_ = sample(nowMs);
  const TransitionId id = current_.id;
  publish();

  frame.camera = camera_;
  frame.progress = p;

  // The sink may have started a new transition.
  if (!active_ || current_.id != id) {
    frame.animating = active_;
    return frame;
  }

  if (p >= 1.0) finish(false);
  frame.animating = active_;
  return frame;
}

void TransitionController::cancel(double nowMs) {
  if (!active_) return;
  camera_ = sample(nowMs);
  const TransitionId id = current_.id;
  publish();
  if (active_ && current_.id == id) finish(true);
}

void TransitionController::cancel() {
  if (!active_) return;
  finish(true);
}

void TransitionController::jumpTo(const CameraState& state) {
  if (!finiteState(state)) {
    throw std::invalid_argument("TransitionController: non-finite camera state");
  }
  cancel();
  camera_ = state;
  publish();
}

void TransitionController::syncCamera(const CameraState& state) {
  if (active_ || !finiteState(state)) return;
  camera_ = state;
}

void TransitionController::publish() {
  if (sink_) sink_(camera_);
}

void TransitionController::finish(bool cancelled) {
  const TransitionId id = current_.id;
  TransitionCompleteCallback cb = std::move(current_.onComplete);
  current_.onComplete = nullptr;
  active_ = false;
  if (cb) cb(id, cancelled);
}

} // namespace gd

#pragma once
#include "gd/camera/Easing.hpp"
#include "gd/geo/Types.hpp"

#include <cstdint>
#include <functional>

namespace gd {

struct TransitionConfig {
  double durationMs{400.0};
  Easing easing{Easing::EaseOutCubic};
};

enum class TransitionState : std::uint8_t { Idle, Animating };

using TransitionId = std::uint64_t;

// Fired exactly once per transition: on arrival (cancelled=false) or when
// pre-empted, cancelled or jumped over (cancelled=true).
using TransitionCompleteCallback = std::function<void(TransitionId id, bool cancelled)>;

// Map backend setCamera(center, zoom).
using CameraSink = std::function<void(const CameraState&)>;

struct CameraFrame {
  CameraState camera;
  bool animating{false};
  double progress{1.0};   // un-eased, 0..1
};

// Drives one camera animation at a time from host-supplied timestamps.
// Progress is derived from elapsed wall time only, so dropped or irregular
// frames never stretch the animation. A new transition starts from wherever
// the camera is at that moment, never from the pre-empted transition's start.
//
// Destroying the controller drops any pending completion silently; call
// cancel() first if the callback must run.
class TransitionController {
public:
  TransitionController() = default;
  explicit TransitionController(const CameraState& initial) : camera_(initial) {}

  void setConfig(const TransitionConfig& cfg) { config_ = cfg; }
  const TransitionConfig& config() const { return config_; }

  void setCameraSink(CameraSink sink) { sink_ = std::move(sink); }

  // Throws std::invalid_argument for a negative or non-finite duration or a
  // non-finite target.
  TransitionId transitionTo(const CameraState& target, double nowMs,
                            TransitionCompleteCallback onComplete = {});
  TransitionId transitionTo(const CameraState& target, double durationMs, double nowMs,
                            TransitionCompleteCallback onComplete = {});

  // Moves the camera to its position at nowMs and finishes the transition
  // once the duration has elapsed.
  CameraFrame advance(double nowMs);

  // Stops at the camera's position at nowMs.
  void cancel(double nowMs);
  // Stops where the last advance() left the camera.
  void cancel();

  void jumpTo(const CameraState& state);

  // Records a camera position the user moved to directly. Not published to
  // the sink and ignored while a transition is running.
  void syncCamera(const CameraState& state);

  // Camera position at nowMs without changing any state.
  CameraState sample(double nowMs) const;

  TransitionState state() const {
    return active_ ? TransitionState::Animating : TransitionState::Idle;
  }
  bool isAnimating() const { return active_; }
  TransitionId activeId() const { return active_ ? current_.id : 0; }
  const CameraState& camera() const { return camera_; }
  const CameraState& startState() const { return current_.start; }
  const CameraState& targetState() const { return current_.target; }

private:
  struct Transition {
    TransitionId id{0};
    CameraState start;
    CameraState target;
    double startMs{0};
    double durationMs{0};
    Easing easing{Easing::EaseOutCubic};
    TransitionCompleteCallback onComplete;
  };

  double progressAt(double nowMs) const;
  static CameraState interpolate(const CameraState& a, const CameraState& b, double e);
  void publish();
  void finish(bool cancelled);

  TransitionConfig config_;
  CameraState camera_;
  CameraSink sink_;

  bool active_{false};
  Transition current_;
  TransitionId nextId_{1};
};

} // namespace gd

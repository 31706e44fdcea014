#pragma once

#include "types.hpp"
#include "rotation_ops.hpp"
#include "kinetrack/debug/tracker_debug_sink.hpp"

#include <cstddef>
#include <vector>

namespace kinetrack::tracker {

struct TrackerParams {
  // time period (s) the physics values are averaged over
  float period = 0.125f;

  // number of discrete slices the period is split into
  int steps = 4;

  // weight of the most recent slice when predicting
  float new_sample_weight = 2.0f;

  // direction only updates once the tracked point moved this far (m).
  // 1mm, tracking hardware is generally sub-millimeter
  float min_offset = 0.001f;

  // rotations below this (deg) give a wildly flailing axis at low speeds
  float min_angle = 0.5f;

  // shortest vector that still normalizes to something sensible
  float min_length = 0.00001f;

  float samplePeriod() const { return period / static_cast<float>(steps); }
  float additiveWeight() const { return new_sample_weight - 1.0f; }

  // averaging window stretched out to simulate more data than was recorded
  float predictedPeriod() const { return period + samplePeriod() * additiveWeight(); }

  // one extra slice so dropping the oldest one transitions smoothly
  std::size_t sampleLength() const { return static_cast<std::size_t>(steps) + 1; }
};

// Throws std::invalid_argument describing the first bad field
void ValidateParams(const TrackerParams& params);

// Estimates smoothed linear and angular velocity / acceleration from discrete poses.
// Not thread safe; one instance per tracked object.
class PhysicsTracker {
public:
  explicit PhysicsTracker(const TrackerParams& params = TrackerParams());

  // Puts the tracker in a known state. The window is seeded with a full period
  // of the given constant motion. angular_velocity is an axis scaled by rad/s.
  void Reset(const Vec3& position, const Quat& rotation,
             const Vec3& velocity, const Vec3& angular_velocity);
  void Reset(const Vec3& position, const Quat& rotation);

  // dt: time (s) since the previous pose. dt <= 0 is ignored.
  // The first call on a fresh tracker only resets it to the given pose.
  void Update(const Vec3& position, const Quat& rotation, float dt);

  // Accessors
  float speed() const { return speed_; }
  const Vec3& direction() const { return direction_; }
  const Vec3& velocity() const { return velocity_; }
  float accelerationStrength() const { return acceleration_strength_; }  // negative when decelerating
  const Vec3& acceleration() const { return acceleration_; }

  float angularSpeed() const { return angular_speed_; }  // deg/s
  const Vec3& angularAxis() const { return angular_axis_; }
  const Vec3& angularVelocity() const { return angular_velocity_; }  // rad/s
  float angularAccelerationStrength() const { return angular_acceleration_strength_; }  // deg/s^2
  const Vec3& angularAcceleration() const { return angular_acceleration_; }  // rad/s^2

  const TrackerParams& params() const { return params_; }
  bool initialized() const { return current_ != kUninitialized; }

  void setDebugSink(kinetrack::debug::TrackerDebugSink* sink) { dbg_ = sink; }

private:
  // One slice of accumulated motion
  struct Sample {
    float distance = 0.0f;
    float angle = 0.0f;

    Vec3 offset = Vec3::Zero();
    Vec3 axis_offset = Vec3::Zero();

    // speeds at the moment the slice was sealed
    float speed = 0.0f;
    float angular_speed = 0.0f;

    float time = 0.0f;

    void Accumulate(const Sample& other, float scalar,
                    const Vec3& direction_anchor, const Vec3& axis_anchor);
  };

  static constexpr std::size_t kUninitialized = static_cast<std::size_t>(-1);

  // Walks newest -> oldest until the combined sample covers `until` seconds
  void accumulate_(Sample& combined, float until,
                   const Vec3& direction_anchor, const Vec3& axis_anchor) const;

  void resetInternal_(const Vec3& position, const Quat& rotation,
                      const Vec3& velocity, const Vec3& angular_velocity, bool implicit);

  kinetrack::debug::TrackerOutputs snapshot_() const;

  TrackerParams params_;

  // circular slice buffer, newest at current_, older ones at current_ + 1, + 2, ...
  std::vector<Sample> samples_;
  std::size_t current_ = kUninitialized;

  // previous-frame history
  Vec3 last_offset_position_ = Vec3::Zero();
  Vec3 last_direction_position_ = Vec3::Zero();
  Quat last_rotation_ = Quat::Identity();

  // outputs
  float speed_ = 0.0f;
  float acceleration_strength_ = 0.0f;
  Vec3 direction_ = Vec3::Zero();
  Vec3 velocity_ = Vec3::Zero();
  Vec3 acceleration_ = Vec3::Zero();

  float angular_speed_ = 0.0f;
  float angular_acceleration_strength_ = 0.0f;
  Vec3 angular_axis_ = Vec3::Zero();
  Vec3 angular_velocity_ = Vec3::Zero();
  Vec3 angular_acceleration_ = Vec3::Zero();

  kinetrack::debug::TrackerDebugSink* dbg_ = nullptr;
};

} // namespace kinetrack::tracker

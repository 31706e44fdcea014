#include "kinetrack/tracker/physics_tracker.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace kinetrack::tracker {

void ValidateParams(const TrackerParams& p) {
  if (!std::isfinite(p.period) || p.period <= 0.0f)
    throw std::invalid_argument("TrackerParams: period must be > 0, got " + std::to_string(p.period));
  if (p.steps < 1)
    throw std::invalid_argument("TrackerParams: steps must be >= 1, got " + std::to_string(p.steps));
  if (!std::isfinite(p.new_sample_weight) || p.new_sample_weight < 1.0f)
    throw std::invalid_argument("TrackerParams: new_sample_weight must be >= 1, got " +
                                std::to_string(p.new_sample_weight));
  if (!(p.min_offset >= 0.0f) || !(p.min_angle >= 0.0f) || !(p.min_length >= 0.0f))
    throw std::invalid_argument("TrackerParams: thresholds must be >= 0");
}

void PhysicsTracker::Sample::Accumulate(const Sample& other, float scalar,
                                        const Vec3& direction_anchor, const Vec3& axis_anchor) {
  distance += other.distance * scalar;
  angle += other.angle * scalar;

  // offsets are not normalized for the dot product, the weighting works without it
  offset += other.offset * (direction_anchor.dot(other.offset) * scalar);
  axis_offset += other.axis_offset * (axis_anchor.dot(other.axis_offset) * scalar);
  time += other.time * scalar;

  // speeds are markers, not sums: fade towards the oldest one as its slice leaves the window
  speed = Lerp(speed, other.speed, scalar);
  angular_speed = Lerp(angular_speed, other.angular_speed, scalar);
}

PhysicsTracker::PhysicsTracker(const TrackerParams& params)
  : params_(params)
{
  ValidateParams(params_);
  samples_.resize(params_.sampleLength());
}

void PhysicsTracker::Reset(const Vec3& position, const Quat& rotation,
                           const Vec3& velocity, const Vec3& angular_velocity) {
  resetInternal_(position, rotation, velocity, angular_velocity, false);
}

void PhysicsTracker::Reset(const Vec3& position, const Quat& rotation) {
  resetInternal_(position, rotation, Vec3::Zero(), Vec3::Zero(), false);
}

void PhysicsTracker::resetInternal_(const Vec3& position, const Quat& rotation,
                                    const Vec3& velocity, const Vec3& angular_velocity,
                                    bool implicit) {
  last_offset_position_ = position;
  last_direction_position_ = position;
  last_rotation_ = rotation;

  speed_ = velocity.norm();
  direction_ = SafeNormalized(velocity, params_.min_length);
  velocity_ = velocity;
  acceleration_strength_ = 0.0f;
  acceleration_ = Vec3::Zero();

  angular_speed_ = angular_velocity.norm() * kRad2Deg;
  angular_axis_ = SafeNormalized(angular_velocity, params_.min_length);
  angular_velocity_ = angular_velocity;
  angular_acceleration_strength_ = 0.0f;
  angular_acceleration_ = Vec3::Zero();

  // seed one slice holding a whole period of the known motion
  for (auto& s : samples_) s = Sample();
  current_ = 0;
  Sample& seed = samples_[current_];
  seed.distance = speed_ * params_.period;
  seed.offset = velocity_ * params_.period;
  seed.angle = angular_speed_ * params_.period;
  seed.axis_offset = angular_axis_ * params_.period;
  seed.speed = speed_;
  seed.angular_speed = angular_speed_;
  seed.time = params_.period;

  if (dbg_) {
    kinetrack::debug::ResetDebug d;
    d.implicit = implicit;
    d.position = position;
    d.initial_velocity = velocity;
    d.initial_angular_velocity = angular_velocity;
    d.out = snapshot_();
    dbg_->onReset(d);
  }
}

void PhysicsTracker::accumulate_(Sample& combined, float until,
                                 const Vec3& direction_anchor, const Vec3& axis_anchor) const {
  const std::size_t n = samples_.size();
  std::size_t idx = current_;

  // every lap over the ring covers at least one period, so a long prediction
  // stretch may wrap several times. The bound stops a pass that rounding left
  // a hair short of `until`.
  const std::size_t laps = 1 + static_cast<std::size_t>(std::ceil(until / params_.period));
  for (std::size_t i = 0; i < n * laps && combined.time < until; ++i) {
    const Sample& s = samples_[idx];
    const float scalar = (s.time > 0.0f) ? Clamp01((until - combined.time) / s.time) : 1.0f;
    combined.Accumulate(s, scalar, direction_anchor, axis_anchor);
    idx = (idx + 1) % n;
  }
}

void PhysicsTracker::Update(const Vec3& position, const Quat& rotation, float dt) {
  if (!initialized()) {
    resetInternal_(position, rotation, Vec3::Zero(), Vec3::Zero(), true);
    return;
  }

  if (!(dt > 0.0f)) return;

  // ------------------------------------------------
  // 1. Single-frame offsets
  // ------------------------------------------------
  const Vec3 current_offset = position - last_offset_position_;
  const float current_distance = current_offset.norm();
  last_offset_position_ = position;

  Vec3 active_direction = position - last_direction_position_;
  bool direction_moved = false;

  // skip tiny deltas and wait for a reliable change in direction
  if (active_direction.norm() < params_.min_offset) {
    active_direction = direction_;
  } else {
    active_direction.normalize();
    last_direction_position_ = position;
    direction_moved = true;
  }

  Vec3 active_axis;
  float current_angle = ToAngleAxisDeg(RotationDelta(last_rotation_, rotation), active_axis);
  bool rotation_moved = false;

  if (current_angle < params_.min_angle) {
    current_angle = 0.0f;
    active_axis = angular_axis_;
  } else {
    last_rotation_ = rotation;
    rotation_moved = true;
  }

  // strong rotations steer the axis more than weak ones
  const float axis_distance = 1.0f + current_angle / 90.0f;

  // ------------------------------------------------
  // 2. Add to the current slice
  // ------------------------------------------------
  Sample& cur = samples_[current_];
  cur.distance += current_distance;
  cur.offset += current_offset;
  cur.angle += current_angle;
  cur.time += dt;

  // extracted axes flip sign; always reinforce the accumulated direction
  if (active_axis.dot(cur.axis_offset) < 0.0f) {
    cur.axis_offset -= active_axis * axis_distance;
  } else {
    cur.axis_offset += active_axis * axis_distance;
  }

  // ------------------------------------------------
  // 3. Combine slices (window, then prediction)
  // ------------------------------------------------
  Sample combined;
  accumulate_(combined, params_.period, active_direction, active_axis);

  const float oldest_speed = combined.speed;
  const float oldest_angular_speed = combined.angular_speed;

  // second pass from the newest slice weights recent motion stronger
  accumulate_(combined, params_.predictedPeriod(), active_direction, active_axis);

  const float predicted_period = params_.predictedPeriod();

  // ------------------------------------------------
  // 4. Outputs
  // ------------------------------------------------
  speed_ = combined.distance / predicted_period;

  if (combined.offset.norm() > params_.min_length) {
    direction_ = combined.offset.normalized();
  } else {
    float direction_vs_active = direction_.dot(active_direction);
    if (direction_vs_active < 0.0f) {
      direction_vs_active = -direction_vs_active;
      direction_ = -direction_;
    }
    direction_ = SafeNormalized(Lerp(active_direction, direction_, direction_vs_active),
                                params_.min_length);
  }
  velocity_ = direction_ * speed_;

  angular_speed_ = combined.angle / predicted_period;

  // axis data is noisier than position, so it always gets one more smoothing step
  if (combined.axis_offset.norm() > params_.min_length) {
    active_axis = combined.axis_offset.normalized();
  }

  float axis_vs_active = angular_axis_.dot(active_axis);
  if (axis_vs_active < 0.0f) {
    axis_vs_active = -axis_vs_active;
    angular_axis_ = -angular_axis_;
  }
  angular_axis_ = SafeNormalized(Lerp(active_axis, angular_axis_, axis_vs_active),
                                 params_.min_length);
  angular_velocity_ = angular_axis_ * (angular_speed_ * kDeg2Rad);

  acceleration_strength_ = (speed_ - oldest_speed) / params_.period;
  acceleration_ = direction_ * acceleration_strength_;

  angular_acceleration_strength_ = (angular_speed_ - oldest_angular_speed) / params_.period;
  angular_acceleration_ = angular_axis_ * (angular_acceleration_strength_ * kDeg2Rad);

  if (dbg_) {
    kinetrack::debug::UpdateDebug d;
    d.dt = dt;
    d.current_distance = current_distance;
    d.current_angle = current_angle;
    d.direction_anchor_moved = direction_moved;
    d.rotation_anchor_moved = rotation_moved;
    d.slice_index = current_;
    d.slice_time = cur.time;
    d.out = snapshot_();
    dbg_->onUpdate(d);
  }

  // ------------------------------------------------
  // 5. Seal a full slice, recycle the oldest as the new current one
  // ------------------------------------------------
  if (cur.time < params_.samplePeriod()) return;

  // last speeds before switching, used as the oldest endpoint for acceleration later
  cur.speed = speed_;
  cur.angular_speed = angular_speed_;

  const std::size_t n = samples_.size();
  const std::size_t sealed = current_;
  current_ = (current_ + n - 1) % n;
  samples_[current_] = Sample();

  if (dbg_) {
    kinetrack::debug::RolloverDebug d;
    d.sealed_index = sealed;
    d.sealed_time = cur.time;
    d.sealed_speed = cur.speed;
    d.sealed_angular_speed = cur.angular_speed;
    d.next_index = current_;
    dbg_->onRollover(d);
  }
}

kinetrack::debug::TrackerOutputs PhysicsTracker::snapshot_() const {
  kinetrack::debug::TrackerOutputs o;
  o.speed = speed_;
  o.direction = direction_;
  o.velocity = velocity_;
  o.acceleration_strength = acceleration_strength_;
  o.acceleration = acceleration_;
  o.angular_speed = angular_speed_;
  o.angular_axis = angular_axis_;
  o.angular_velocity = angular_velocity_;
  o.angular_acceleration_strength = angular_acceleration_strength_;
  o.angular_acceleration = angular_acceleration_;
  return o;
}

} // namespace kinetrack::tracker

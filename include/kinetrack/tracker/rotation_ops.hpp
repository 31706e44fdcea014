#pragma once

#include "types.hpp"

#include <algorithm>
#include <cmath>

namespace kinetrack::tracker {

// Vectors no longer than min_length normalize to zero instead of blowing up
inline Vec3 SafeNormalized(const Vec3& v, float min_length) {
  const float n = v.norm();
  if (n <= min_length) return Vec3::Zero();
  return v / n;
}

inline float Clamp01(float t) { return std::min(1.0f, std::max(0.0f, t)); }

inline float Lerp(float a, float b, float t) { return a + (b - a) * Clamp01(t); }

inline Vec3 Lerp(const Vec3& a, const Vec3& b, float t) { return a + (b - a) * Clamp01(t); }

// Rotation -> (angle in degrees, unit axis). Shortest arc, so angle is in [0, 180].
// A zero rotation reports angle 0 with the x axis.
inline float ToAngleAxisDeg(const Quat& q, Vec3& axis) {
  Eigen::AngleAxisf aa(q.normalized());
  axis = aa.axis();
  return aa.angle() * kRad2Deg;
}

// Relative rotation taking `from` onto `to`, expressed in the world frame
inline Quat RotationDelta(const Quat& from, const Quat& to) {
  return (to * from.inverse()).normalized();
}

} // namespace kinetrack::tracker

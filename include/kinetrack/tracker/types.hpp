#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace kinetrack::tracker {

using Vec3 = Eigen::Vector3f;
using Quat = Eigen::Quaternionf;

constexpr float kRad2Deg = 57.29577951308232f;
constexpr float kDeg2Rad = 0.017453292519943295f;

} // namespace kinetrack::tracker

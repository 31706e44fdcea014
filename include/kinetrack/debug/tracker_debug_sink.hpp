#pragma once

#include <Eigen/Dense>
#include <cstddef>

namespace kinetrack::debug {

// Snapshot of the tracker outputs after a reset or update
struct TrackerOutputs
{
  float speed = 0.0f;
  Eigen::Vector3f direction = Eigen::Vector3f::Zero();
  Eigen::Vector3f velocity  = Eigen::Vector3f::Zero();
  float acceleration_strength = 0.0f;
  Eigen::Vector3f acceleration = Eigen::Vector3f::Zero();

  float angular_speed = 0.0f;  // deg/s
  Eigen::Vector3f angular_axis     = Eigen::Vector3f::Zero();
  Eigen::Vector3f angular_velocity = Eigen::Vector3f::Zero();  // rad/s
  float angular_acceleration_strength = 0.0f;
  Eigen::Vector3f angular_acceleration = Eigen::Vector3f::Zero();  // rad/s^2
};

struct ResetDebug
{
  bool implicit = false;  // triggered by the first Update() rather than Reset()

  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  Eigen::Vector3f initial_velocity = Eigen::Vector3f::Zero();
  Eigen::Vector3f initial_angular_velocity = Eigen::Vector3f::Zero();

  TrackerOutputs out;
};

struct UpdateDebug
{
  float dt = 0.0f;

  // raw single-frame input
  float current_distance = 0.0f;
  float current_angle = 0.0f;  // deg, 0 when below the angle threshold
  bool direction_anchor_moved = false;
  bool rotation_anchor_moved = false;

  std::size_t slice_index = 0;
  float slice_time = 0.0f;

  TrackerOutputs out;
};

struct RolloverDebug
{
  std::size_t sealed_index = 0;
  float sealed_time = 0.0f;
  float sealed_speed = 0.0f;
  float sealed_angular_speed = 0.0f;

  std::size_t next_index = 0;
};

// Debug sink interface
class TrackerDebugSink
{
public:
  virtual ~TrackerDebugSink() = default;

  virtual void onReset(const ResetDebug& reset) = 0;
  virtual void onUpdate(const UpdateDebug& update) = 0;

  // current slice filled up and a fresh one begins
  virtual void onRollover(const RolloverDebug& rollover) = 0;
};

} // namespace kinetrack::debug

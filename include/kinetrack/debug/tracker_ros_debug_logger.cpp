#include "kinetrack/debug/tracker_ros_debug_logger.hpp"

namespace kinetrack::debug {

TrackerRosDebugLogger::TrackerRosDebugLogger(rclcpp::Logger base_logger,
                                             rclcpp::Clock::SharedPtr clock,
                                             RosDebugParams params)
  : l_reset_(base_logger.get_child(params.child_reset)),
    l_update_(base_logger.get_child(params.child_update)),
    l_slices_(base_logger.get_child(params.child_slices)),
    clock_(std::move(clock)),
    p_(std::move(params))
{}

void TrackerRosDebugLogger::onReset(const ResetDebug& d)
{
  if (!p_.enable_reset) return;

  // resets are rare (grab, teleport), never throttled
  RCLCPP_INFO(
    l_reset_,
    "[reset%s] pos=%.3f %.3f %.3f | vel=%.3f %.3f %.3f | ang_vel=%.3f %.3f %.3f",
    d.implicit ? " (auto)" : "",
    d.position.x(), d.position.y(), d.position.z(),
    d.initial_velocity.x(), d.initial_velocity.y(), d.initial_velocity.z(),
    d.initial_angular_velocity.x(), d.initial_angular_velocity.y(), d.initial_angular_velocity.z()
  );
}

void TrackerRosDebugLogger::onUpdate(const UpdateDebug& d)
{
  if (!p_.enable_update) return;

  if (p_.update_debug_raw) {
    RCLCPP_DEBUG_THROTTLE(
      l_update_, *clock_, p_.throttle_ms_update,
      "[raw   ] dt=%.4f | dist=%.5f | angle=%.3f | anchors dir=%d rot=%d | slice=%zu t=%.4f",
      d.dt, d.current_distance, d.current_angle,
      d.direction_anchor_moved ? 1 : 0, d.rotation_anchor_moved ? 1 : 0,
      d.slice_index, d.slice_time
    );
  }

  if (p_.update_info_summary) {
    const TrackerOutputs& o = d.out;
    RCLCPP_INFO_THROTTLE(
      l_update_, *clock_, p_.throttle_ms_update,
      "[track ] speed=%.3f dir=%.3f %.3f %.3f acc=%.3f | "
      "ang_speed=%.2f axis=%.3f %.3f %.3f ang_acc=%.2f",
      o.speed, o.direction.x(), o.direction.y(), o.direction.z(), o.acceleration_strength,
      o.angular_speed, o.angular_axis.x(), o.angular_axis.y(), o.angular_axis.z(),
      o.angular_acceleration_strength
    );
  }
}

void TrackerRosDebugLogger::onRollover(const RolloverDebug& d)
{
  if (!p_.enable_rollover) return;

  RCLCPP_DEBUG_THROTTLE(
    l_slices_, *clock_, p_.throttle_ms_rollover,
    "[slice ] sealed=%zu t=%.4f speed=%.3f ang_speed=%.2f -> current=%zu",
    d.sealed_index, d.sealed_time, d.sealed_speed, d.sealed_angular_speed, d.next_index
  );
}

} // namespace kinetrack::debug

#pragma once

#include "kinetrack/debug/tracker_debug_sink.hpp"
#include <rclcpp/rclcpp.hpp>
#include <string>

namespace kinetrack::debug {

struct RosDebugParams
{
  bool enable_reset    = true;
  bool enable_update   = true;
  bool enable_rollover = true;

  // throttle in ms so per-frame updates do not flood the log
  int throttle_ms_update   = 1000;
  int throttle_ms_rollover = 1000;

  // update summary at INFO, raw per-frame input at DEBUG
  bool update_info_summary = true;
  bool update_debug_raw    = true;

  // child logger suffix
  std::string child_reset   = "reset";
  std::string child_update  = "update";
  std::string child_slices  = "slices";
};

class TrackerRosDebugLogger final : public TrackerDebugSink
{
public:
  TrackerRosDebugLogger(rclcpp::Logger base_logger,
                        rclcpp::Clock::SharedPtr clock,
                        RosDebugParams params);

  void onReset(const ResetDebug& reset) override;
  void onUpdate(const UpdateDebug& update) override;
  void onRollover(const RolloverDebug& rollover) override;

private:
  rclcpp::Logger l_reset_;
  rclcpp::Logger l_update_;
  rclcpp::Logger l_slices_;
  rclcpp::Clock::SharedPtr clock_;
  RosDebugParams p_;
};

} // namespace kinetrack::debug

#include <rclcpp/rclcpp.hpp>
#include <geometry_msgs/msg/pose_stamped.hpp>
#include <geometry_msgs/msg/twist_stamped.hpp>
#include <geometry_msgs/msg/accel_stamped.hpp>
#include <std_srvs/srv/trigger.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <exception>
#include <string>

#include "kinetrack/tracker/physics_tracker.hpp"
#include "kinetrack/debug/tracker_ros_debug_logger.hpp"

#include <Eigen/Dense>

using kinetrack::tracker::Quat;
using kinetrack::tracker::Vec3;

static inline Vec3 toVec3(const geometry_msgs::msg::Point& p)
{
    return Vec3(static_cast<float>(p.x), static_cast<float>(p.y), static_cast<float>(p.z));
}

static inline Quat toQuat(const geometry_msgs::msg::Quaternion& q)
{
    return Quat(static_cast<float>(q.w), static_cast<float>(q.x),
                static_cast<float>(q.y), static_cast<float>(q.z));
}

static inline geometry_msgs::msg::Vector3 toVectorMsg(const Vec3& v)
{
    geometry_msgs::msg::Vector3 out;
    out.x = v.x();
    out.y = v.y();
    out.z = v.z();
    return out;
}

class PoseTrackerNode : public rclcpp::Node
{
public:
    PoseTrackerNode()
        : Node("pose_tracker"),
            message_count_(0),
            last_stamp_(rclcpp::Time(0, 0, RCL_ROS_TIME)),
            tracker_(loadTrackerParams())
    {
        const std::string pose_topic    = declare_parameter<std::string>("pose_topic", "/tracked/pose");
        const std::string twist_topic   = declare_parameter<std::string>("twist_topic", "/kinetrack/twist");
        const std::string accel_topic   = declare_parameter<std::string>("accel_topic", "/kinetrack/accel");
        const std::string release_topic = declare_parameter<std::string>("release_topic", "/kinetrack/release");
        grabbed_ = declare_parameter<bool>("track_on_start", true);

        // tracked poses: keep only the latest, like any sensor stream
        rclcpp::SensorDataQoS qos;
        qos.keep_last(1);

        subscription_ = this->create_subscription<geometry_msgs::msg::PoseStamped>(
            pose_topic, qos,
            std::bind(&PoseTrackerNode::poseCallback, this, std::placeholders::_1));

        twist_pub_   = this->create_publisher<geometry_msgs::msg::TwistStamped>(twist_topic, 10);
        accel_pub_   = this->create_publisher<geometry_msgs::msg::AccelStamped>(accel_topic, 10);
        release_pub_ = this->create_publisher<geometry_msgs::msg::TwistStamped>(release_topic, 10);

        grab_srv_ = this->create_service<std_srvs::srv::Trigger>(
            "~/grab",
            std::bind(&PoseTrackerNode::onGrab, this, std::placeholders::_1, std::placeholders::_2));
        release_srv_ = this->create_service<std_srvs::srv::Trigger>(
            "~/release",
            std::bind(&PoseTrackerNode::onRelease, this, std::placeholders::_1, std::placeholders::_2));

        // debug logger
        kinetrack::debug::RosDebugParams dp;
        const bool debug_enable = declare_parameter<bool>("debug.enable", true);
        const int throttle_ms   = static_cast<int>(declare_parameter<int64_t>("debug.throttle_ms", 1000));
        dp.enable_reset    = debug_enable;
        dp.enable_update   = debug_enable;
        dp.enable_rollover = debug_enable;
        dp.throttle_ms_update   = throttle_ms;
        dp.throttle_ms_rollover = throttle_ms;
        throttle_ms_ = throttle_ms;

        dbg_logger_ = std::make_unique<kinetrack::debug::TrackerRosDebugLogger>(
            this->get_logger().get_child("tracker"),
            this->get_clock(),
            dp
        );

        tracker_.setDebugSink(dbg_logger_.get());

        const auto& p = tracker_.params();
        RCLCPP_INFO(this->get_logger(),
                    "Pose tracker started. Subscribing to %s | period=%.3f steps=%d predicted=%.4f | %s",
                    pose_topic.c_str(), p.period, p.steps, p.predictedPeriod(),
                    grabbed_ ? "tracking" : "waiting for grab");
    }

private:

    kinetrack::tracker::TrackerParams loadTrackerParams()
    {
        kinetrack::tracker::TrackerParams p;
        p.period            = static_cast<float>(declare_parameter<double>("tracker.period", p.period));
        p.steps             = static_cast<int>(declare_parameter<int64_t>("tracker.steps", p.steps));
        p.new_sample_weight = static_cast<float>(declare_parameter<double>("tracker.new_sample_weight", p.new_sample_weight));
        p.min_offset        = static_cast<float>(declare_parameter<double>("tracker.min_offset", p.min_offset));
        p.min_angle         = static_cast<float>(declare_parameter<double>("tracker.min_angle", p.min_angle));
        p.min_length        = static_cast<float>(declare_parameter<double>("tracker.min_length", p.min_length));
        return p;
    }

    void poseCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg)
    {
        message_count_++;

        const Vec3 position = toVec3(msg->pose.position);
        const Quat rotation = toQuat(msg->pose.orientation);
        const rclcpp::Time stamp(msg->header.stamp, RCL_ROS_TIME);

        // dt from consecutive stamps; the first message only anchors the clock
        double dt = 0.0;
        const bool has_last = have_pose_;
        if (has_last) {
            dt = (stamp - last_stamp_).seconds();
        }

        const Vec3 prev_position = last_position_;
        last_stamp_ = stamp;
        last_position_ = position;
        last_rotation_ = rotation;
        frame_id_ = msg->header.frame_id;
        have_pose_ = true;

        if (!grabbed_) return;

        if (!has_last || !tracker_.initialized()) {
            tracker_.Update(position, rotation, 0.0f);
            return;
        }

        if (dt <= 0.0) {
            RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), throttle_ms_,
                                 "Dropping pose #%d with non-increasing stamp (dt=%.6f)",
                                 message_count_, dt);
            return;
        }

        tracker_.Update(position, rotation, static_cast<float>(dt));

        // plain frame-to-frame integration, to compare against the smoothed value
        const float direct_speed =
            (position - prev_position).norm() / std::max(static_cast<float>(dt), 0.00001f);
        RCLCPP_DEBUG_THROTTLE(this->get_logger(), *this->get_clock(), throttle_ms_,
                              "speed smoothed=%.3f direct=%.3f", tracker_.speed(), direct_speed);

        publishKinematics(stamp);
    }

    void publishKinematics(const rclcpp::Time& stamp)
    {
        geometry_msgs::msg::TwistStamped twist;
        twist.header.stamp = stamp;
        twist.header.frame_id = frame_id_;
        twist.twist.linear  = toVectorMsg(tracker_.velocity());
        twist.twist.angular = toVectorMsg(tracker_.angularVelocity());
        twist_pub_->publish(twist);

        geometry_msgs::msg::AccelStamped accel;
        accel.header.stamp = stamp;
        accel.header.frame_id = frame_id_;
        accel.accel.linear  = toVectorMsg(tracker_.acceleration());
        accel.accel.angular = toVectorMsg(tracker_.angularAcceleration());
        accel_pub_->publish(accel);
    }

    // Re-anchor at the last seen pose with no motion and start feeding poses
    void onGrab(const std::shared_ptr<std_srvs::srv::Trigger::Request> /*req*/,
                std::shared_ptr<std_srvs::srv::Trigger::Response> res)
    {
        if (!have_pose_) {
            res->success = false;
            res->message = "no pose received yet";
            return;
        }

        tracker_.Reset(last_position_, last_rotation_);
        grabbed_ = true;

        res->success = true;
        res->message = "tracking";
    }

    // Stop feeding and hand off the current estimate once
    void onRelease(const std::shared_ptr<std_srvs::srv::Trigger::Request> /*req*/,
                   std::shared_ptr<std_srvs::srv::Trigger::Response> res)
    {
        if (!grabbed_ || !tracker_.initialized()) {
            res->success = false;
            res->message = "not tracking";
            return;
        }
        grabbed_ = false;

        geometry_msgs::msg::TwistStamped twist;
        twist.header.stamp = last_stamp_;
        twist.header.frame_id = frame_id_;
        twist.twist.linear  = toVectorMsg(tracker_.velocity());
        twist.twist.angular = toVectorMsg(tracker_.angularVelocity());
        release_pub_->publish(twist);

        char buf[96];
        std::snprintf(buf, sizeof(buf), "released at speed=%.3f ang_speed=%.2f",
                      tracker_.speed(), tracker_.angularSpeed());
        RCLCPP_INFO(this->get_logger(), "%s", buf);

        res->success = true;
        res->message = buf;
    }

    rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr subscription_;
    rclcpp::Publisher<geometry_msgs::msg::TwistStamped>::SharedPtr twist_pub_;
    rclcpp::Publisher<geometry_msgs::msg::AccelStamped>::SharedPtr accel_pub_;
    rclcpp::Publisher<geometry_msgs::msg::TwistStamped>::SharedPtr release_pub_;
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr grab_srv_;
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr release_srv_;

    int message_count_;
    rclcpp::Time last_stamp_;
    Vec3 last_position_ = Vec3::Zero();
    Quat last_rotation_ = Quat::Identity();
    std::string frame_id_ = "world";
    bool have_pose_ = false;
    bool grabbed_ = true;
    int throttle_ms_ = 1000;

    kinetrack::tracker::PhysicsTracker tracker_;

    //logger
    std::unique_ptr<kinetrack::debug::TrackerRosDebugLogger> dbg_logger_;
};

int main(int argc, char *argv[])
{
    rclcpp::init(argc, argv);

    std::shared_ptr<PoseTrackerNode> node;
    try {
        node = std::make_shared<PoseTrackerNode>();
    } catch (const std::exception& e) {
        // bad TrackerParams (std::invalid_argument) or a mistyped ROS parameter
        RCLCPP_FATAL(rclcpp::get_logger("pose_tracker"), "Invalid parameters: %s", e.what());
        rclcpp::shutdown();
        return 1;
    }

    rclcpp::executors::SingleThreadedExecutor executor;
    executor.add_node(node);

    RCLCPP_INFO(node->get_logger(), "Starting pose tracker with SingleThreadedExecutor");
    executor.spin();

    rclcpp::shutdown();
    return 0;
}

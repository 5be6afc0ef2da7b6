#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rclcpp/executors/multi_threaded_executor.hpp"
#include "rclcpp_lifecycle/lifecycle_node.hpp"
#include "lifecycle_msgs/msg/state.hpp"

#include "grasp_decision/async_event_client.hpp"
#include "grasp_decision/decision_engine.hpp"

#include "diagnostic_msgs/msg/diagnostic_array.hpp"
#include "diagnostic_msgs/msg/diagnostic_status.hpp"
#include "diagnostic_msgs/msg/key_value.hpp"
#include "geometry_msgs/msg/point_stamped.hpp"
#include "std_msgs/msg/bool.hpp"
#include "std_msgs/msg/int32_multi_array.hpp"
#include "vision_msgs/msg/detection3_d_array.hpp"

using namespace std::chrono_literals;

/**
 * @brief Person warning fan-out: ROS topic, then the HTTP client if configured.
 */
class TopicEventPublisher : public EventPublisher
{
public:
  TopicEventPublisher(
    rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Bool>::SharedPtr pub,
    std::shared_ptr<AsyncEventClient> http)
  : pub_(std::move(pub)), http_(std::move(http))
  {}

  bool publish(EventKind kind, const PersonWarningEvent & event) override
  {
    bool ok = true;

    if (pub_ && pub_->is_activated()) {
      std_msgs::msg::Bool msg;
      msg.data = event.status == WarningStatus::TRIGGERED;
      pub_->publish(msg);
    } else {
      ok = false;
    }

    if (http_) {
      ok = http_->publish(kind, event) && ok;
    }
    return ok;
  }

private:
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Bool>::SharedPtr pub_;
  std::shared_ptr<AsyncEventClient> http_;
};

class GraspDecisionNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  using CallbackReturn =
    rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  explicit GraspDecisionNode()
  : rclcpp_lifecycle::LifecycleNode("grasp_decision")
  {}

  // ============================================================
  // Lifecycle
  // ============================================================

  CallbackReturn on_configure(const rclcpp_lifecycle::State &) override
  {
    DecisionConfig config;
    try {
      config = loadConfig();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(get_logger(), "Bad parameters: %s", e.what());
      return CallbackReturn::FAILURE;
    }

    control_rate_hz_ = declareOnce<double>("control_rate_hz", 20.0);
    position_scale_  = declareOnce<double>("position_scale", 1.0);
    event_endpoint_  = declareOnce<std::string>("event_endpoint", "");

    auto warning_pub = create_publisher<std_msgs::msg::Bool>(
      "person_warning", rclcpp::QoS(1).reliable().transient_local());
    auto target_pub = create_publisher<geometry_msgs::msg::PointStamped>("grasp_target", 10);
    auto status_pub = create_publisher<std_msgs::msg::Int32MultiArray>("detection_status", 10);
    auto diag_pub = create_publisher<diagnostic_msgs::msg::DiagnosticArray>("/diagnostics", 10);

    std::shared_ptr<AsyncEventClient> event_client;
    if (!event_endpoint_.empty()) {
      event_client = std::make_shared<AsyncEventClient>(event_endpoint_);
    }

    std::shared_ptr<DecisionEngine> engine;
    try {
      engine = std::make_shared<DecisionEngine>(
        config,
        std::make_shared<TopicEventPublisher>(warning_pub, event_client),
        get_clock());
    } catch (const std::invalid_argument & e) {
      RCLCPP_ERROR(get_logger(), "%s", e.what());
      return CallbackReturn::FAILURE;
    }

    {
      std::lock_guard<std::mutex> lock(interfaces_mutex_);
      warning_pub_ = warning_pub;
      target_pub_ = target_pub;
      status_pub_ = status_pub;
      diag_pub_ = diag_pub;
      event_client_ = event_client;
      engine_ = engine;
    }

    detection_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
    control_group_   = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

    rclcpp::SubscriptionOptions sub_options;
    sub_options.callback_group = detection_group_;

    detections_sub_ = create_subscription<vision_msgs::msg::Detection3DArray>(
      "detections", rclcpp::SensorDataQoS(),
      std::bind(&GraspDecisionNode::detectionsCallback, this, std::placeholders::_1),
      sub_options);

    RCLCPP_INFO(get_logger(), "Configured (event endpoint: %s)",
      event_endpoint_.empty() ? "none" : event_endpoint_.c_str());
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_activate(const rclcpp_lifecycle::State &) override
  {
    warning_pub_->on_activate();
    target_pub_->on_activate();
    status_pub_->on_activate();
    diag_pub_->on_activate();

    control_timer_ = create_wall_timer(
      std::chrono::duration<double>(1.0 / control_rate_hz_),
      std::bind(&GraspDecisionNode::controlLoop, this),
      control_group_);

    RCLCPP_INFO(get_logger(), "Activated");
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override
  {
    control_timer_.reset();

    warning_pub_->on_deactivate();
    target_pub_->on_deactivate();
    status_pub_->on_deactivate();
    diag_pub_->on_deactivate();

    RCLCPP_WARN(get_logger(), "Deactivated");
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override
  {
    control_timer_.reset();
    releaseInterfaces();

    RCLCPP_INFO(get_logger(), "Cleaned up");
    return CallbackReturn::SUCCESS;
  }

  CallbackReturn on_shutdown(const rclcpp_lifecycle::State &) override
  {
    control_timer_.reset();
    RCLCPP_WARN(get_logger(), "Shutdown");
    return CallbackReturn::SUCCESS;
  }

private:
  // ============================================================
  // Parameters
  // ============================================================

  // Parameters survive cleanup, so a second configure must not redeclare them.
  template<typename T>
  T declareOnce(const std::string & name, const T & default_value)
  {
    if (!has_parameter(name)) {
      return declare_parameter<T>(name, default_value);
    }
    return get_parameter(name).get_value<T>();
  }

  DecisionConfig loadConfig()
  {
    DecisionConfig c;

    const auto labels = declareOnce<std::vector<int64_t>>(
      "person_label_ids", std::vector<int64_t>{0});
    c.person_label_ids.assign(labels.begin(), labels.end());

    auto & pw = c.person_warning;
    pw.d_in       = declareOnce<double>("person_warning.d_in", pw.d_in);
    pw.d_out      = declareOnce<double>("person_warning.d_out", pw.d_out);
    pw.t_warn     = declareOnce<double>("person_warning.t_warn", pw.t_warn);
    pw.t_clear    = declareOnce<double>("person_warning.t_clear", pw.t_clear);
    pw.grace_time = declareOnce<double>("person_warning.grace_time", pw.grace_time);

    c.danger_y_threshold =
      declareOnce<double>("object_zones.danger_y_threshold", c.danger_y_threshold);

    auto & gz = c.grasp_zone;
    gz.mode  = parseGraspZoneMode(
      declareOnce<std::string>("object_zones.grasp_zone.mode", "rect"));
    gz.x_min = declareOnce<double>("object_zones.grasp_zone.x_min", gz.x_min);
    gz.x_max = declareOnce<double>("object_zones.grasp_zone.x_max", gz.x_max);
    gz.y_min = declareOnce<double>("object_zones.grasp_zone.y_min", gz.y_min);
    gz.y_max = declareOnce<double>("object_zones.grasp_zone.y_max", gz.y_max);
    gz.r_min = declareOnce<double>("object_zones.grasp_zone.r_min", gz.r_min);
    gz.r_max = declareOnce<double>("object_zones.grasp_zone.r_max", gz.r_max);

    c.state_expiration_time =
      declareOnce<double>("state_expiration_time", c.state_expiration_time);

    return c;
  }

  // Callbacks on the detection and control groups may still be running;
  // they hold their own references taken under interfaces_mutex_.
  void releaseInterfaces()
  {
    detections_sub_.reset();

    std::lock_guard<std::mutex> lock(interfaces_mutex_);
    warning_pub_.reset();
    target_pub_.reset();
    status_pub_.reset();
    diag_pub_.reset();
    engine_.reset();
    event_client_.reset();
  }

  // ============================================================
  // Detection input (device-processing path)
  // ============================================================

  void detectionsCallback(const vision_msgs::msg::Detection3DArray::SharedPtr msg)
  {
    if (get_current_state().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
      return;
    }

    std::shared_ptr<DecisionEngine> engine;
    rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Int32MultiArray>::SharedPtr status_pub;
    rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diag_pub;
    std::shared_ptr<AsyncEventClient> event_client;
    {
      std::lock_guard<std::mutex> lock(interfaces_mutex_);
      engine = engine_;
      status_pub = status_pub_;
      diag_pub = diag_pub_;
      event_client = event_client_;
    }
    if (!engine) return;

    const std::string & device_id = msg->header.frame_id;

    std::vector<Point3f> positions;
    std::vector<int32_t> labels;
    positions.reserve(msg->detections.size());
    labels.reserve(msg->detections.size());

    for (const auto & det : msg->detections) {
      if (det.results.empty()) {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 2000,
          "[%s] detection without class hypothesis dropped", device_id.c_str());
        continue;
      }

      const auto & class_id = det.results.front().hypothesis.class_id;
      const auto label = parseClassLabel(class_id);
      if (!label) {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 2000,
          "[%s] non-integer class id '%s' dropped", device_id.c_str(), class_id.c_str());
        continue;
      }

      const auto & p = det.bbox.center.position;
      positions.push_back(Point3f{
        static_cast<float>(p.x * position_scale_),
        static_cast<float>(p.y * position_scale_),
        static_cast<float>(p.z * position_scale_)});
      labels.push_back(*label);
    }

    std::vector<DetectionStatus> statuses;
    try {
      statuses = engine->decide(device_id, positions, labels, now());
    } catch (const std::invalid_argument & e) {
      RCLCPP_ERROR(get_logger(), "%s", e.what());
      return;
    }

    publishStatuses(status_pub, statuses);
    publishDiagnostics(*engine, diag_pub, event_client, device_id);
  }

  void publishStatuses(
    const rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Int32MultiArray>::SharedPtr & pub,
    const std::vector<DetectionStatus> & statuses)
  {
    if (!pub) return;

    std_msgs::msg::Int32MultiArray out;
    out.data.reserve(statuses.size());
    for (const auto s : statuses) {
      out.data.push_back(static_cast<int32_t>(s));
    }
    pub->publish(out);
  }

  // ============================================================
  // Control loop (independent reader)
  // ============================================================

  void controlLoop()
  {
    std::shared_ptr<DecisionEngine> engine;
    rclcpp_lifecycle::LifecyclePublisher<geometry_msgs::msg::PointStamped>::SharedPtr target_pub;
    {
      std::lock_guard<std::mutex> lock(interfaces_mutex_);
      engine = engine_;
      target_pub = target_pub_;
    }
    if (!engine || !target_pub) return;

    const auto target = engine->targetSnapshot();
    if (!target) {
      return;
    }

    geometry_msgs::msg::PointStamped msg;
    msg.header.stamp = now();
    msg.point.x = (*target)[0];
    msg.point.y = (*target)[1];
    msg.point.z = (*target)[2];
    target_pub->publish(msg);
  }

  // ============================================================
  // Diagnostics
  // ============================================================

  void publishDiagnostics(
    const DecisionEngine & engine,
    const rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr & pub,
    const std::shared_ptr<AsyncEventClient> & event_client,
    const std::string & device_id)
  {
    if (!pub) return;

    const auto safety = engine.safetyRecord(device_id);
    if (!safety) return;

    diagnostic_msgs::msg::DiagnosticArray array;
    array.header.stamp = now();

    diagnostic_msgs::msg::DiagnosticStatus status;
    status.name = "grasp_decision/" + device_id;
    status.hardware_id = device_id;

    switch (safety->warning_state) {
      case WarningState::ALARM:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
        break;
      case WarningState::PENDING:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
        break;
      case WarningState::SAFE:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
        break;
    }
    status.message = toString(safety->warning_state);

    diagnostic_msgs::msg::KeyValue kv;
    kv.key = "has_target";
    kv.value = engine.targetSnapshot() ? "true" : "false";
    status.values.push_back(kv);

    if (event_client) {
      kv.key = "event_link";
      kv.value = event_client->isHealthy() ? "ok" : "failing";
      status.values.push_back(kv);
    }

    array.status.push_back(status);
    pub->publish(array);
  }

private:
  // ROS
  rclcpp::Subscription<vision_msgs::msg::Detection3DArray>::SharedPtr detections_sub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Bool>::SharedPtr warning_pub_;
  rclcpp_lifecycle::LifecyclePublisher<geometry_msgs::msg::PointStamped>::SharedPtr target_pub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Int32MultiArray>::SharedPtr status_pub_;
  rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diag_pub_;
  rclcpp::TimerBase::SharedPtr control_timer_;
  rclcpp::CallbackGroup::SharedPtr detection_group_;
  rclcpp::CallbackGroup::SharedPtr control_group_;

  std::shared_ptr<DecisionEngine> engine_;
  std::shared_ptr<AsyncEventClient> event_client_;

  // Guards the shared pointers above against releaseInterfaces()
  std::mutex interfaces_mutex_;

  double control_rate_hz_{20.0};
  double position_scale_{1.0};
  std::string event_endpoint_;
};

// ============================================================
// main
// ============================================================

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  auto node = std::make_shared<GraspDecisionNode>();
  rclcpp::executors::MultiThreadedExecutor exec(rclcpp::ExecutorOptions(), 2);
  exec.add_node(node->get_node_base_interface());
  exec.spin();

  rclcpp::shutdown();
  return 0;
}

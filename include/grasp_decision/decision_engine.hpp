#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <rclcpp/clock.hpp>
#include <rclcpp/logger.hpp>
#include <rclcpp/time.hpp>

#include "grasp_decision/decision_config.hpp"
#include "grasp_decision/decision_types.hpp"
#include "grasp_decision/device_state_store.hpp"
#include "grasp_decision/event_publisher.hpp"
#include "grasp_decision/person_safety_machine.hpp"
#include "grasp_decision/target_arbitrator.hpp"

/**
 * @brief Per-frame decision entry point.
 *
 * One instance per process, shared by handle with the device-processing
 * threads and the control-side reader. decide() may run concurrently for
 * different device ids; calls for the same device must not overlap.
 */
class DecisionEngine
{
public:
  // Throws std::invalid_argument if config.validate() reports problems.
  DecisionEngine(
    const DecisionConfig & config,
    std::shared_ptr<EventPublisher> publisher,
    rclcpp::Clock::SharedPtr clock = std::make_shared<rclcpp::Clock>(RCL_ROS_TIME));

  // Throws std::invalid_argument if positions and labels differ in length.
  std::vector<DetectionStatus> decide(
    const std::string & device_id,
    const std::vector<Point3f> & positions,
    const std::vector<int32_t> & labels);

  std::vector<DetectionStatus> decide(
    const std::string & device_id,
    const std::vector<Point3f> & positions,
    const std::vector<int32_t> & labels,
    const rclcpp::Time & now);

  // Safe from any thread.
  std::optional<Point3f> targetSnapshot() const;
  std::optional<GlobalTarget> globalTarget() const;

  // Diagnostics. safetyRecord() must be called from the thread that processes
  // device_id, or after that thread has stopped; the grasp and id accessors
  // are safe from any thread.
  std::optional<DeviceSafetyRecord> safetyRecord(const std::string & device_id) const;
  std::optional<DeviceGraspRecord> graspRecord(const std::string & device_id) const;
  std::vector<std::string> deviceIds() const;

  const DecisionConfig & config() const { return config_; }

private:
  void processPersons(
    const std::string & device_id,
    const std::vector<Point3f> & positions,
    const std::vector<std::size_t> & indices,
    const rclcpp::Time & now,
    std::vector<DetectionStatus> & statuses);

  void processObjects(
    const std::string & device_id,
    const std::vector<Point3f> & positions,
    const std::vector<std::size_t> & indices,
    const rclcpp::Time & now,
    std::vector<DetectionStatus> & statuses);

  void publishWarning(WarningStatus status, const std::string & device_id, const rclcpp::Time & now);

  const DecisionConfig config_;
  std::shared_ptr<EventPublisher> publisher_;
  rclcpp::Clock::SharedPtr clock_;
  rclcpp::Logger logger_;

  PersonSafetyMachine safety_machine_;
  DeviceStateStore store_;
  TargetArbitrator arbitrator_;

  // serializes grasp writers: update record -> collect -> swap target
  std::mutex arbitration_mutex_;
};

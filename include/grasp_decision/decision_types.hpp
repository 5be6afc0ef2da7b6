#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <rclcpp/time.hpp>

// x, y, z in millimetres, already in the common robot frame
using Point3f = std::array<float, 3>;

enum class DetectionStatus : int32_t
{
  // objects
  OBJECT_GRASPABLE = 0,
  OBJECT_DANGEROUS = 1,
  OBJECT_OUT_OF_RANGE = 2,
  OBJECT_PENDING_GRASP = 3,

  // persons
  HUMAN_SAFE = 100,
  HUMAN_DANGEROUS = 101
};

enum class ZoneClass
{
  DANGEROUS,
  GRASPABLE,
  OUT_OF_RANGE
};

enum class WarningState
{
  SAFE,
  PENDING,
  ALARM
};

enum class WarningStatus
{
  TRIGGERED,
  CLEARED
};

const char * toString(DetectionStatus status);
const char * toString(WarningState state);
const char * toString(WarningStatus status);

struct DeviceSafetyRecord
{
  WarningState warning_state{WarningState::SAFE};
  double time_in_danger{0.0};   // s, accumulates in PENDING
  double time_clear{0.0};       // s, accumulates in ALARM
  std::optional<rclcpp::Time> last_seen_time;   // last person observation
  std::optional<rclcpp::Time> last_eval_time;   // last state machine step
  std::optional<double> last_distance;
};

struct NearestObject
{
  Point3f position{};
  double distance{0.0};
};

struct DeviceGraspRecord
{
  // position and distance travel together
  std::optional<NearestObject> nearest;
  rclcpp::Time last_update_time{0, 0, RCL_ROS_TIME};
};

struct GlobalTarget
{
  Point3f position{};
  double distance{0.0};
  std::string device_id;
};

#include "grasp_decision/person_safety_machine.hpp"

#include <algorithm>
#include <limits>

namespace
{

void resetTimers(DeviceSafetyRecord & record)
{
  record.time_in_danger = 0.0;
  record.time_clear = 0.0;
}

}  // namespace

PersonSafetyMachine::PersonSafetyMachine(const PersonWarningConfig & config)
: config_(config)
{}

std::optional<WarningStatus> PersonSafetyMachine::update(
  DeviceSafetyRecord & record,
  const std::optional<double> & min_distance,
  const rclcpp::Time & now) const
{
  double dt = 0.0;
  if (record.last_eval_time) {
    dt = std::max(0.0, (now - *record.last_eval_time).seconds());
  }
  record.last_eval_time = now;

  if (min_distance) {
    record.last_seen_time = now;
    record.last_distance = *min_distance;
    return step(record, *min_distance, dt);
  }

  // nobody in this frame: keep progress during the grace window
  if (record.last_seen_time &&
      (now - *record.last_seen_time).seconds() <= config_.grace_time)
  {
    return std::nullopt;
  }

  // person has left
  return step(record, std::numeric_limits<double>::infinity(), dt);
}

std::optional<WarningStatus> PersonSafetyMachine::step(
  DeviceSafetyRecord & record,
  double distance,
  double dt) const
{
  switch (record.warning_state) {
    case WarningState::SAFE:
      if (distance < config_.d_in) {
        record.warning_state = WarningState::PENDING;
        resetTimers(record);
      }
      return std::nullopt;

    case WarningState::PENDING:
      if (distance >= config_.d_out) {
        record.warning_state = WarningState::SAFE;
        resetTimers(record);
        return std::nullopt;
      }
      if (distance < config_.d_in) {
        record.time_in_danger += dt;
        if (record.time_in_danger >= config_.t_warn) {
          record.warning_state = WarningState::ALARM;
          resetTimers(record);
          return WarningStatus::TRIGGERED;
        }
      }
      // between d_in and d_out: hold
      return std::nullopt;

    case WarningState::ALARM:
      if (distance >= config_.d_out) {
        record.time_clear += dt;
        if (record.time_clear >= config_.t_clear) {
          record.warning_state = WarningState::SAFE;
          resetTimers(record);
          return WarningStatus::CLEARED;
        }
      } else {
        record.time_clear = 0.0;
      }
      return std::nullopt;
  }

  return std::nullopt;
}

DetectionStatus PersonSafetyMachine::personStatus(WarningState state)
{
  return state == WarningState::ALARM ?
         DetectionStatus::HUMAN_DANGEROUS :
         DetectionStatus::HUMAN_SAFE;
}

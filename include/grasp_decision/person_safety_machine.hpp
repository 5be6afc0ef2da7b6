#pragma once

#include <optional>

#include <rclcpp/time.hpp>

#include "grasp_decision/decision_config.hpp"
#include "grasp_decision/decision_types.hpp"

/**
 * @brief Per-device person proximity state machine.
 *
 *   SAFE    --(d < d_in)-------------------------> PENDING
 *   PENDING --(d >= d_out)-----------------------> SAFE
 *   PENDING --(time_in_danger >= t_warn)---------> ALARM   [TRIGGERED]
 *   ALARM   --(d >= d_out for t_clear seconds)---> SAFE    [CLEARED]
 *
 * A frame without persons holds the record while the last sighting is
 * within grace_time, and counts as "person left" afterwards.
 *
 * Stateless itself: all state lives in the DeviceSafetyRecord passed in.
 */
class PersonSafetyMachine
{
public:
  explicit PersonSafetyMachine(const PersonWarningConfig & config);

  // min_distance is empty when no person was seen in this frame.
  // Returns the status edge crossed by this step, if any.
  std::optional<WarningStatus> update(
    DeviceSafetyRecord & record,
    const std::optional<double> & min_distance,
    const rclcpp::Time & now) const;

  static DetectionStatus personStatus(WarningState state);

private:
  std::optional<WarningStatus> step(
    DeviceSafetyRecord & record,
    double distance,
    double dt) const;

  PersonWarningConfig config_;
};

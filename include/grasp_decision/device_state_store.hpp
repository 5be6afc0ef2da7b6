#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <rclcpp/time.hpp>

#include "grasp_decision/decision_types.hpp"

/**
 * @brief Device id -> per-device records.
 *
 * Records are created on first sight and never erased; std::map keeps
 * references stable while other devices are inserted. Safety records are
 * only touched by the call processing that device. Grasp records are read
 * across devices, so every grasp access goes through the store mutex.
 */
class DeviceStateStore
{
public:
  struct Candidate
  {
    std::string device_id;
    NearestObject nearest;
  };

  DeviceSafetyRecord & safetyRecord(const std::string & device_id);

  void updateGrasp(
    const std::string & device_id,
    const std::optional<NearestObject> & nearest,
    const rclcpp::Time & stamp);

  // Clears the nearest object when older than expiration_s; returns true if cleared.
  bool markExpiredIfStale(
    const std::string & device_id,
    const rclcpp::Time & now,
    double expiration_s);

  // Expires stale devices, then returns live nearest objects in device id order.
  std::vector<Candidate> collectCandidates(const rclcpp::Time & now, double expiration_s);

  // Copies under the store mutex, but the record itself is written through
  // safetyRecord() without it. Only race-free on the thread processing device_id.
  std::optional<DeviceSafetyRecord> safetySnapshot(const std::string & device_id) const;
  std::optional<DeviceGraspRecord> graspSnapshot(const std::string & device_id) const;
  std::vector<std::string> deviceIds() const;

private:
  struct DeviceRecord
  {
    DeviceSafetyRecord safety;
    DeviceGraspRecord grasp;
  };

  DeviceRecord & getOrCreate(const std::string & device_id);
  static bool expireLocked(DeviceRecord & record, const rclcpp::Time & now, double expiration_s);

  mutable std::mutex mutex_;
  std::map<std::string, DeviceRecord> devices_;
};

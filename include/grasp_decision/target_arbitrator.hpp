#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "grasp_decision/decision_types.hpp"
#include "grasp_decision/device_state_store.hpp"

/**
 * @brief Deterministic cross-device selection of the next grasp target.
 *
 * Safety intent:
 *  - Selection runs outside the lock, the lock only guards a pointer swap
 *  - Deterministic tie-break: first minimum in device id order
 *  - Readers always receive a copy
 */
class TargetArbitrator
{
public:
  // Replaces the shared target with the nearest candidate (or none) and returns it.
  std::optional<GlobalTarget> recompute(const std::vector<DeviceStateStore::Candidate> & candidates);

  // Control-side read: coordinates only, copied under the lock.
  std::optional<Point3f> snapshot() const;

  std::optional<GlobalTarget> current() const;

  static std::optional<GlobalTarget> select(
    const std::vector<DeviceStateStore::Candidate> & candidates);

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const GlobalTarget> target_;
};

#include "grasp_decision/target_arbitrator.hpp"

std::optional<GlobalTarget> TargetArbitrator::select(
  const std::vector<DeviceStateStore::Candidate> & candidates)
{
  const DeviceStateStore::Candidate * best = nullptr;

  // candidates arrive in device id order; strict < keeps the first minimum
  for (const auto & c : candidates) {
    if (!best || c.nearest.distance < best->nearest.distance) {
      best = &c;
    }
  }

  if (!best) {
    return std::nullopt;
  }

  GlobalTarget target;
  target.position = best->nearest.position;
  target.distance = best->nearest.distance;
  target.device_id = best->device_id;
  return target;
}

std::optional<GlobalTarget> TargetArbitrator::recompute(
  const std::vector<DeviceStateStore::Candidate> & candidates)
{
  std::optional<GlobalTarget> next = select(candidates);

  std::shared_ptr<const GlobalTarget> swapped;
  if (next) {
    swapped = std::make_shared<const GlobalTarget>(*next);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    target_.swap(swapped);
  }
  // previous target released here, outside the lock
  return next;
}

std::optional<Point3f> TargetArbitrator::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!target_) {
    return std::nullopt;
  }
  return target_->position;
}

std::optional<GlobalTarget> TargetArbitrator::current() const
{
  std::shared_ptr<const GlobalTarget> target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = target_;
  }
  if (!target) {
    return std::nullopt;
  }
  return *target;
}

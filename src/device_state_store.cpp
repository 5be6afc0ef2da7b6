#include "grasp_decision/device_state_store.hpp"

DeviceStateStore::DeviceRecord & DeviceStateStore::getOrCreate(const std::string & device_id)
{
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    it = devices_.emplace(device_id, DeviceRecord{}).first;
  }
  return it->second;
}

DeviceSafetyRecord & DeviceStateStore::safetyRecord(const std::string & device_id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return getOrCreate(device_id).safety;
}

void DeviceStateStore::updateGrasp(
  const std::string & device_id,
  const std::optional<NearestObject> & nearest,
  const rclcpp::Time & stamp)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto & grasp = getOrCreate(device_id).grasp;
  grasp.nearest = nearest;
  grasp.last_update_time = stamp;
}

bool DeviceStateStore::expireLocked(
  DeviceRecord & record,
  const rclcpp::Time & now,
  double expiration_s)
{
  if (!record.grasp.nearest) {
    return false;
  }
  const double age_s = (now - record.grasp.last_update_time).seconds();
  if (age_s <= expiration_s) {
    return false;
  }
  record.grasp.nearest.reset();
  return true;
}

bool DeviceStateStore::markExpiredIfStale(
  const std::string & device_id,
  const rclcpp::Time & now,
  double expiration_s)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  return expireLocked(it->second, now, expiration_s);
}

std::vector<DeviceStateStore::Candidate> DeviceStateStore::collectCandidates(
  const rclcpp::Time & now,
  double expiration_s)
{
  std::vector<Candidate> candidates;

  std::lock_guard<std::mutex> lock(mutex_);
  candidates.reserve(devices_.size());

  for (auto & entry : devices_) {
    expireLocked(entry.second, now, expiration_s);
    if (entry.second.grasp.nearest) {
      candidates.push_back(Candidate{entry.first, *entry.second.grasp.nearest});
    }
  }
  return candidates;
}

std::optional<DeviceSafetyRecord> DeviceStateStore::safetySnapshot(const std::string & device_id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second.safety;
}

std::optional<DeviceGraspRecord> DeviceStateStore::graspSnapshot(const std::string & device_id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second.grasp;
}

std::vector<std::string> DeviceStateStore::deviceIds() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(devices_.size());
  for (const auto & entry : devices_) {
    ids.push_back(entry.first);
  }
  return ids;
}

#include "grasp_decision/decision_engine.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <rclcpp/logging.hpp>

#include "grasp_decision/zone_classifier.hpp"

namespace
{

constexpr float kPositionTolerance = 1e-3f;   // mm

const DecisionConfig & checkedConfig(const DecisionConfig & config)
{
  const auto errors = config.validate();
  if (!errors.empty()) {
    std::ostringstream msg;
    msg << "invalid decision config:";
    for (const auto & e : errors) {
      msg << "\n  - " << e;
    }
    throw std::invalid_argument(msg.str());
  }
  return config;
}

bool samePosition(const Point3f & a, const Point3f & b)
{
  return std::fabs(a[0] - b[0]) <= kPositionTolerance &&
         std::fabs(a[1] - b[1]) <= kPositionTolerance &&
         std::fabs(a[2] - b[2]) <= kPositionTolerance;
}

}  // namespace

DecisionEngine::DecisionEngine(
  const DecisionConfig & config,
  std::shared_ptr<EventPublisher> publisher,
  rclcpp::Clock::SharedPtr clock)
: config_(checkedConfig(config)),
  publisher_(std::move(publisher)),
  clock_(std::move(clock)),
  logger_(rclcpp::get_logger("grasp_decision")),
  safety_machine_(config_.person_warning)
{
  if (!clock_) {
    throw std::invalid_argument("DecisionEngine requires a clock");
  }

  std::ostringstream labels;
  for (std::size_t i = 0; i < config_.person_label_ids.size(); ++i) {
    labels << (i ? "," : "") << config_.person_label_ids[i];
  }

  const auto & pw = config_.person_warning;
  RCLCPP_INFO(
    logger_,
    "Decision engine ready: person_labels=[%s] d_in=%.1f d_out=%.1f "
    "t_warn=%.2f t_clear=%.2f grace=%.2f danger_y=%.1f zone=%s expiration=%.2f",
    labels.str().c_str(), pw.d_in, pw.d_out, pw.t_warn, pw.t_clear, pw.grace_time,
    config_.danger_y_threshold,
    config_.grasp_zone.mode == GraspZoneMode::RECT ? "rect" : "radius",
    config_.state_expiration_time);

  if (!publisher_) {
    RCLCPP_WARN(logger_, "No event publisher attached, person warnings are only logged");
  }
}

std::vector<DetectionStatus> DecisionEngine::decide(
  const std::string & device_id,
  const std::vector<Point3f> & positions,
  const std::vector<int32_t> & labels)
{
  return decide(device_id, positions, labels, clock_->now());
}

std::vector<DetectionStatus> DecisionEngine::decide(
  const std::string & device_id,
  const std::vector<Point3f> & positions,
  const std::vector<int32_t> & labels,
  const rclcpp::Time & now)
{
  if (positions.size() != labels.size()) {
    throw std::invalid_argument(
      "decide(" + device_id + "): positions has " + std::to_string(positions.size()) +
      " rows but labels has " + std::to_string(labels.size()) + " entries");
  }

  const std::size_t n = labels.size();
  if (n == 0) {
    return {};
  }

  std::vector<std::size_t> person_idx;
  std::vector<std::size_t> object_idx;
  person_idx.reserve(n);
  object_idx.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    if (config_.isPersonLabel(labels[i])) {
      person_idx.push_back(i);
    } else {
      object_idx.push_back(i);
    }
  }

  std::vector<DetectionStatus> statuses(n, DetectionStatus::OBJECT_OUT_OF_RANGE);

  processPersons(device_id, positions, person_idx, now, statuses);
  if (!object_idx.empty()) {
    processObjects(device_id, positions, object_idx, now, statuses);
  }

  return statuses;
}

// ============================================================
// Persons
// ============================================================

void DecisionEngine::processPersons(
  const std::string & device_id,
  const std::vector<Point3f> & positions,
  const std::vector<std::size_t> & indices,
  const rclcpp::Time & now,
  std::vector<DetectionStatus> & statuses)
{
  std::optional<double> min_distance;
  for (const auto i : indices) {
    const double d = distanceToOrigin(positions[i]);
    if (!min_distance || d < *min_distance) {
      min_distance = d;
    }
  }

  auto & record = store_.safetyRecord(device_id);
  const WarningState before = record.warning_state;

  const auto edge = safety_machine_.update(record, min_distance, now);

  if (record.warning_state != before) {
    const std::string dist = min_distance ? std::to_string(*min_distance) : "none";
    RCLCPP_WARN(
      logger_, "[%s] person safety %s -> %s (min distance %s)",
      device_id.c_str(), toString(before), toString(record.warning_state), dist.c_str());
  }

  if (edge) {
    publishWarning(*edge, device_id, now);
  }

  const DetectionStatus status = PersonSafetyMachine::personStatus(record.warning_state);
  for (const auto i : indices) {
    statuses[i] = status;
  }
}

// ============================================================
// Objects
// ============================================================

void DecisionEngine::processObjects(
  const std::string & device_id,
  const std::vector<Point3f> & positions,
  const std::vector<std::size_t> & indices,
  const rclcpp::Time & now,
  std::vector<DetectionStatus> & statuses)
{
  std::vector<ZoneClass> zones;
  classifyZones(positions, indices, config_, zones);

  std::optional<NearestObject> nearest;
  std::vector<std::size_t> graspable;

  for (std::size_t k = 0; k < indices.size(); ++k) {
    const std::size_t i = indices[k];
    switch (zones[k]) {
      case ZoneClass::DANGEROUS:
        statuses[i] = DetectionStatus::OBJECT_DANGEROUS;
        break;
      case ZoneClass::OUT_OF_RANGE:
        statuses[i] = DetectionStatus::OBJECT_OUT_OF_RANGE;
        break;
      case ZoneClass::GRASPABLE: {
        statuses[i] = DetectionStatus::OBJECT_GRASPABLE;
        graspable.push_back(i);
        const double d = distanceToOrigin(positions[i]);
        if (!nearest || d < nearest->distance) {
          nearest = NearestObject{positions[i], d};
        }
        break;
      }
    }
  }

  std::optional<GlobalTarget> target;
  {
    std::lock_guard<std::mutex> lock(arbitration_mutex_);
    store_.updateGrasp(device_id, nearest, now);
    target = arbitrator_.recompute(
      store_.collectCandidates(now, config_.state_expiration_time));
  }

  if (!target || target->device_id != device_id) {
    return;
  }

  for (const auto i : graspable) {
    if (samePosition(positions[i], target->position)) {
      statuses[i] = DetectionStatus::OBJECT_PENDING_GRASP;
      break;
    }
  }
}

// ============================================================
// Events
// ============================================================

void DecisionEngine::publishWarning(
  WarningStatus status,
  const std::string & device_id,
  const rclcpp::Time & now)
{
  if (status == WarningStatus::TRIGGERED) {
    RCLCPP_ERROR(logger_, "[%s] PERSON WARNING TRIGGERED", device_id.c_str());
  } else {
    RCLCPP_WARN(logger_, "[%s] person warning cleared", device_id.c_str());
  }

  if (!publisher_) {
    return;
  }

  PersonWarningEvent event;
  event.status = status;
  event.timestamp = now.seconds();
  event.device_id = device_id;

  try {
    if (!publisher_->publish(EventKind::PERSON_WARNING, event)) {
      RCLCPP_ERROR(
        logger_, "[%s] failed to publish person warning (%s)",
        device_id.c_str(), toString(status));
    }
  } catch (const std::exception & e) {
    RCLCPP_ERROR(
      logger_, "[%s] person warning publish threw: %s",
      device_id.c_str(), e.what());
  }
}

// ============================================================
// Accessors
// ============================================================

std::optional<Point3f> DecisionEngine::targetSnapshot() const
{
  return arbitrator_.snapshot();
}

std::optional<GlobalTarget> DecisionEngine::globalTarget() const
{
  return arbitrator_.current();
}

std::optional<DeviceSafetyRecord> DecisionEngine::safetyRecord(const std::string & device_id) const
{
  return store_.safetySnapshot(device_id);
}

std::optional<DeviceGraspRecord> DecisionEngine::graspRecord(const std::string & device_id) const
{
  return store_.graspSnapshot(device_id);
}

std::vector<std::string> DecisionEngine::deviceIds() const
{
  return store_.deviceIds();
}

#include "grasp_decision/decision_config.hpp"

#include <algorithm>
#include <stdexcept>

namespace
{

void requireNonNegative(double value, const char * name, std::vector<std::string> & errors)
{
  if (!(value >= 0.0)) {
    errors.push_back(std::string(name) + " must be >= 0 (got " + std::to_string(value) + ")");
  }
}

void requireOrdered(
  double lo, double hi,
  const char * lo_name, const char * hi_name,
  std::vector<std::string> & errors)
{
  if (!(lo < hi)) {
    errors.push_back(std::string(lo_name) + " must be less than " + hi_name +
      " (" + std::to_string(lo) + " >= " + std::to_string(hi) + ")");
  }
}

}  // namespace

std::vector<std::string> DecisionConfig::validate() const
{
  std::vector<std::string> errors;

  const auto & pw = person_warning;
  requireNonNegative(pw.d_in, "person_warning.d_in", errors);
  requireOrdered(pw.d_in, pw.d_out, "person_warning.d_in", "person_warning.d_out", errors);
  requireNonNegative(pw.t_warn, "person_warning.t_warn", errors);
  requireNonNegative(pw.t_clear, "person_warning.t_clear", errors);
  requireNonNegative(pw.grace_time, "person_warning.grace_time", errors);

  requireNonNegative(danger_y_threshold, "object_zones.danger_y_threshold", errors);

  switch (grasp_zone.mode) {
    case GraspZoneMode::RECT:
      requireOrdered(grasp_zone.x_min, grasp_zone.x_max, "grasp_zone.x_min", "grasp_zone.x_max", errors);
      requireNonNegative(grasp_zone.y_min, "grasp_zone.y_min", errors);
      requireOrdered(grasp_zone.y_min, grasp_zone.y_max, "grasp_zone.y_min", "grasp_zone.y_max", errors);
      break;
    case GraspZoneMode::RADIUS:
      requireNonNegative(grasp_zone.r_min, "grasp_zone.r_min", errors);
      requireOrdered(grasp_zone.r_min, grasp_zone.r_max, "grasp_zone.r_min", "grasp_zone.r_max", errors);
      break;
  }

  if (!(state_expiration_time > 0.0)) {
    errors.push_back("state_expiration_time must be > 0 (got " +
      std::to_string(state_expiration_time) + ")");
  }

  return errors;
}

bool DecisionConfig::isPersonLabel(int32_t label) const
{
  return std::find(person_label_ids.begin(), person_label_ids.end(), label) !=
         person_label_ids.end();
}

GraspZoneMode parseGraspZoneMode(const std::string & mode)
{
  if (mode == "rect") {
    return GraspZoneMode::RECT;
  }
  if (mode == "radius") {
    return GraspZoneMode::RADIUS;
  }
  throw std::invalid_argument("unsupported grasp zone mode '" + mode + "' (expected rect or radius)");
}

std::optional<int32_t> parseClassLabel(const std::string & class_id)
{
  std::size_t pos = 0;
  int value = 0;
  try {
    value = std::stoi(class_id, &pos);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
  if (pos != class_id.size()) {
    return std::nullopt;
  }
  return static_cast<int32_t>(value);
}

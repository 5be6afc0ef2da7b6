#include "grasp_decision/zone_classifier.hpp"

#include <cmath>

ZoneClass classifyZone(const Point3f & position, const DecisionConfig & config)
{
  const double x = position[0];
  const double abs_y = std::fabs(static_cast<double>(position[1]));

  // danger strip along the vehicle wins over grasp zone membership
  if (abs_y < config.danger_y_threshold) {
    return ZoneClass::DANGEROUS;
  }

  const auto & zone = config.grasp_zone;
  bool inside = false;

  switch (zone.mode) {
    case GraspZoneMode::RECT:
      inside = x > zone.x_min && x < zone.x_max &&
               abs_y > zone.y_min && abs_y < zone.y_max;
      break;
    case GraspZoneMode::RADIUS: {
      const double r = distanceToOrigin(position);
      inside = r > zone.r_min && r < zone.r_max;
      break;
    }
  }

  return inside ? ZoneClass::GRASPABLE : ZoneClass::OUT_OF_RANGE;
}

void classifyZones(
  const std::vector<Point3f> & positions,
  const std::vector<std::size_t> & indices,
  const DecisionConfig & config,
  std::vector<ZoneClass> & out)
{
  out.resize(indices.size());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    out[i] = classifyZone(positions[indices[i]], config);
  }
}

double distanceToOrigin(const Point3f & position)
{
  const double x = position[0];
  const double y = position[1];
  const double z = position[2];
  return std::sqrt(x * x + y * y + z * z);
}

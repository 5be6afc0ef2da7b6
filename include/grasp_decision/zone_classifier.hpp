#pragma once

#include <cstddef>
#include <vector>

#include "grasp_decision/decision_config.hpp"
#include "grasp_decision/decision_types.hpp"

// Danger strip first, then grasp zone, otherwise out of range.
ZoneClass classifyZone(const Point3f & position, const DecisionConfig & config);

// Batch form; out[i] corresponds to positions[indices[i]].
void classifyZones(
  const std::vector<Point3f> & positions,
  const std::vector<std::size_t> & indices,
  const DecisionConfig & config,
  std::vector<ZoneClass> & out);

double distanceToOrigin(const Point3f & position);

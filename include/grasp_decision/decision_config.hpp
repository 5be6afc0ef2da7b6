#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class GraspZoneMode
{
  RECT,
  RADIUS
};

struct GraspZoneConfig
{
  GraspZoneMode mode{GraspZoneMode::RECT};

  // rect mode (mm), y bounds apply to |y|, z unconstrained
  double x_min{-200.0};
  double x_max{2000.0};
  double y_min{1550.0};
  double y_max{2500.0};

  // radius mode (mm)
  double r_min{0.0};
  double r_max{0.0};
};

struct PersonWarningConfig
{
  double d_in{3000.0};      // mm
  double d_out{3050.0};     // mm
  double t_warn{3.0};       // s
  double t_clear{3.0};      // s
  double grace_time{0.5};   // s
};

/**
 * @brief Decision core parameters.
 *
 * Immutable once handed to DecisionEngine. validate() lists every problem
 * found; an empty list means the configuration is usable.
 */
struct DecisionConfig
{
  std::vector<int32_t> person_label_ids{0};
  PersonWarningConfig person_warning;

  double danger_y_threshold{1500.0};   // |y| below this is too close to the vehicle
  GraspZoneConfig grasp_zone;

  double state_expiration_time{1.0};   // s

  std::vector<std::string> validate() const;
  bool isPersonLabel(int32_t label) const;
};

GraspZoneMode parseGraspZoneMode(const std::string & mode);

// Whole-string decimal integer; nullopt for "", "1.5", "2abc" or out of int32 range.
std::optional<int32_t> parseClassLabel(const std::string & class_id);

#pragma once

#include <string>

#include "grasp_decision/decision_types.hpp"

enum class EventKind
{
  PERSON_WARNING
};

const char * toString(EventKind kind);

struct PersonWarningEvent
{
  WarningStatus status{WarningStatus::TRIGGERED};
  double timestamp{0.0};   // s since epoch
  std::string device_id;
};

/**
 * @brief Outbound side of the safety path.
 *
 * publish() must not block. It reports failure by returning false or by
 * throwing; the decision path logs either and carries on.
 */
class EventPublisher
{
public:
  virtual ~EventPublisher() = default;

  virtual bool publish(EventKind kind, const PersonWarningEvent & event) = 0;
};

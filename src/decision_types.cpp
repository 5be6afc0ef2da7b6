#include "grasp_decision/decision_types.hpp"
#include "grasp_decision/event_publisher.hpp"

const char * toString(DetectionStatus status)
{
  switch (status) {
    case DetectionStatus::OBJECT_GRASPABLE:     return "OBJECT_GRASPABLE";
    case DetectionStatus::OBJECT_DANGEROUS:     return "OBJECT_DANGEROUS";
    case DetectionStatus::OBJECT_OUT_OF_RANGE:  return "OBJECT_OUT_OF_RANGE";
    case DetectionStatus::OBJECT_PENDING_GRASP: return "OBJECT_PENDING_GRASP";
    case DetectionStatus::HUMAN_SAFE:           return "HUMAN_SAFE";
    case DetectionStatus::HUMAN_DANGEROUS:      return "HUMAN_DANGEROUS";
  }
  return "UNKNOWN";
}

const char * toString(WarningState state)
{
  switch (state) {
    case WarningState::SAFE:    return "SAFE";
    case WarningState::PENDING: return "PENDING";
    case WarningState::ALARM:   return "ALARM";
  }
  return "UNKNOWN";
}

const char * toString(WarningStatus status)
{
  switch (status) {
    case WarningStatus::TRIGGERED: return "triggered";
    case WarningStatus::CLEARED:   return "cleared";
  }
  return "unknown";
}

const char * toString(EventKind kind)
{
  switch (kind) {
    case EventKind::PERSON_WARNING: return "person_warning";
  }
  return "unknown";
}

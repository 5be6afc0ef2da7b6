#include <gtest/gtest.h>

#include <optional>

#include "grasp_decision/person_safety_machine.hpp"
#include "test_helpers.hpp"

namespace
{

class PersonSafetyMachineTest : public ::testing::Test
{
protected:
  PersonSafetyMachineTest()
  : machine_(testConfig().person_warning)
  {}

  // Feeds `distance` every `step_ms` over [from_ms, to_ms] and counts edges.
  void feed(std::optional<double> distance, int64_t from_ms, int64_t to_ms, int64_t step_ms = 100)
  {
    for (int64_t t = from_ms; t <= to_ms; t += step_ms) {
      const auto edge = machine_.update(record_, distance, ms(t));
      if (edge == WarningStatus::TRIGGERED) ++triggered_;
      if (edge == WarningStatus::CLEARED) ++cleared_;
    }
  }

  PersonSafetyMachine machine_;
  DeviceSafetyRecord record_;
  int triggered_{0};
  int cleared_{0};
};

}  // namespace

TEST_F(PersonSafetyMachineTest, EntersPendingBelowDin)
{
  EXPECT_FALSE(machine_.update(record_, 2000.0, ms(0)));
  EXPECT_EQ(record_.warning_state, WarningState::PENDING);
  EXPECT_DOUBLE_EQ(record_.time_in_danger, 0.0);
  EXPECT_DOUBLE_EQ(record_.time_clear, 0.0);
}

TEST_F(PersonSafetyMachineTest, StaysSafeBetweenThresholds)
{
  feed(3100.0, 0, 5000);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
  EXPECT_EQ(triggered_, 0);
}

TEST_F(PersonSafetyMachineTest, FullCycleEmitsEachEdgeOnce)
{
  feed(3000.0 - 1.0, 0, 1500);
  EXPECT_EQ(record_.warning_state, WarningState::ALARM);
  EXPECT_EQ(triggered_, 1);
  EXPECT_EQ(cleared_, 0);

  feed(3200.0 + 1.0, 1600, 3000);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
  EXPECT_EQ(triggered_, 1);
  EXPECT_EQ(cleared_, 1);
  EXPECT_DOUBLE_EQ(record_.time_in_danger, 0.0);
  EXPECT_DOUBLE_EQ(record_.time_clear, 0.0);
}

TEST_F(PersonSafetyMachineTest, PendingFallsBackToSafeWithoutEvent)
{
  feed(2000.0, 0, 500);
  EXPECT_EQ(record_.warning_state, WarningState::PENDING);
  EXPECT_GT(record_.time_in_danger, 0.0);

  feed(4000.0, 600, 600);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
  EXPECT_DOUBLE_EQ(record_.time_in_danger, 0.0);
  EXPECT_EQ(triggered_ + cleared_, 0);
}

TEST_F(PersonSafetyMachineTest, PendingHoldsInHysteresisBand)
{
  feed(2000.0, 0, 300);
  const double progress = record_.time_in_danger;

  feed(3100.0, 400, 2000);
  EXPECT_EQ(record_.warning_state, WarningState::PENDING);
  EXPECT_DOUBLE_EQ(record_.time_in_danger, progress);
  EXPECT_EQ(triggered_, 0);
}

TEST_F(PersonSafetyMachineTest, ReturningInsideDoutResetsClearTimer)
{
  feed(2000.0, 0, 1500);
  ASSERT_EQ(record_.warning_state, WarningState::ALARM);

  feed(4000.0, 1600, 2000);
  EXPECT_GT(record_.time_clear, 0.0);

  feed(3100.0, 2100, 2100);
  EXPECT_EQ(record_.warning_state, WarningState::ALARM);
  EXPECT_DOUBLE_EQ(record_.time_clear, 0.0);
  EXPECT_EQ(cleared_, 0);
}

TEST_F(PersonSafetyMachineTest, GraceWindowHoldsProgress)
{
  feed(2000.0, 0, 1500);
  ASSERT_EQ(record_.warning_state, WarningState::ALARM);

  // last sighting at 1500 ms, grace 0.5 s
  feed(std::nullopt, 1700, 2000);
  EXPECT_EQ(record_.warning_state, WarningState::ALARM);
  EXPECT_DOUBLE_EQ(record_.time_clear, 0.0);

  feed(std::nullopt, 2100, 4000);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
  EXPECT_EQ(cleared_, 1);
}

TEST_F(PersonSafetyMachineTest, GraceWindowHoldsPendingProgress)
{
  feed(2000.0, 0, 500);
  const double progress = record_.time_in_danger;

  feed(std::nullopt, 600, 900);
  EXPECT_EQ(record_.warning_state, WarningState::PENDING);
  EXPECT_DOUBLE_EQ(record_.time_in_danger, progress);

  // beyond grace the person counts as gone
  feed(std::nullopt, 1100, 1100);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
}

TEST_F(PersonSafetyMachineTest, NeverSeenIsSafe)
{
  feed(std::nullopt, 0, 3000);
  EXPECT_EQ(record_.warning_state, WarningState::SAFE);
  EXPECT_FALSE(record_.last_seen_time.has_value());
}

TEST(PersonSafetyMachine, StatusIsDeviceWide)
{
  EXPECT_EQ(PersonSafetyMachine::personStatus(WarningState::ALARM), DetectionStatus::HUMAN_DANGEROUS);
  EXPECT_EQ(PersonSafetyMachine::personStatus(WarningState::PENDING), DetectionStatus::HUMAN_SAFE);
  EXPECT_EQ(PersonSafetyMachine::personStatus(WarningState::SAFE), DetectionStatus::HUMAN_SAFE);
}

#include <gtest/gtest.h>

#include "grasp_decision/zone_classifier.hpp"
#include "test_helpers.hpp"

namespace
{

DecisionConfig exampleRectConfig()
{
  auto c = testConfig();
  c.danger_y_threshold = 1500.0;
  c.grasp_zone.x_min = 500.0;
  c.grasp_zone.x_max = 2000.0;
  c.grasp_zone.y_min = 300.0;
  c.grasp_zone.y_max = 1500.0;
  return c;
}

}  // namespace

TEST(ZoneClassifier, DangerStripWinsOverGraspZone)
{
  // inside the rect zone, but |y| = 400 < 1500
  EXPECT_EQ(classifyZone({600.f, 400.f, 300.f}, exampleRectConfig()), ZoneClass::DANGEROUS);
  EXPECT_EQ(classifyZone({600.f, -400.f, 300.f}, exampleRectConfig()), ZoneClass::DANGEROUS);
}

TEST(ZoneClassifier, RectZoneUsesAbsoluteY)
{
  const auto c = testConfig();
  EXPECT_EQ(classifyZone({1000.f, 1800.f, 0.f}, c), ZoneClass::GRASPABLE);
  EXPECT_EQ(classifyZone({1000.f, -1800.f, 0.f}, c), ZoneClass::GRASPABLE);
  // z is not constrained in rect mode
  EXPECT_EQ(classifyZone({1000.f, 1800.f, 99999.f}, c), ZoneClass::GRASPABLE);
}

TEST(ZoneClassifier, RectBoundsAreExclusive)
{
  const auto c = testConfig();
  EXPECT_EQ(classifyZone({2000.f, 1800.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);
  EXPECT_EQ(classifyZone({-200.f, 1800.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);
  EXPECT_EQ(classifyZone({1000.f, 2500.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);
  // 1500 <= |y| <= 1550: neither dangerous nor graspable
  EXPECT_EQ(classifyZone({1000.f, 1520.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);
}

TEST(ZoneClassifier, DangerThresholdIsStrict)
{
  const auto c = testConfig();
  EXPECT_EQ(classifyZone({1000.f, 1499.f, 0.f}, c), ZoneClass::DANGEROUS);
  EXPECT_NE(classifyZone({1000.f, 1500.f, 0.f}, c), ZoneClass::DANGEROUS);
}

TEST(ZoneClassifier, RadiusMode)
{
  auto c = testConfig();
  c.danger_y_threshold = 100.0;
  c.grasp_zone.mode = GraspZoneMode::RADIUS;
  c.grasp_zone.r_min = 1000.0;
  c.grasp_zone.r_max = 2000.0;

  EXPECT_EQ(classifyZone({0.f, 1200.f, 900.f}, c), ZoneClass::GRASPABLE);     // r = 1500
  EXPECT_EQ(classifyZone({0.f, 300.f, 400.f}, c), ZoneClass::OUT_OF_RANGE);   // r = 500
  EXPECT_EQ(classifyZone({0.f, 2000.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);    // r = 2000
  EXPECT_EQ(classifyZone({1500.f, 50.f, 0.f}, c), ZoneClass::DANGEROUS);
}

TEST(ZoneClassifier, ZeroVector)
{
  EXPECT_EQ(classifyZone({0.f, 0.f, 0.f}, testConfig()), ZoneClass::DANGEROUS);

  auto c = testConfig();
  c.danger_y_threshold = 0.0;
  EXPECT_EQ(classifyZone({0.f, 0.f, 0.f}, c), ZoneClass::OUT_OF_RANGE);
}

TEST(ZoneClassifier, BatchFollowsIndexList)
{
  const std::vector<Point3f> positions = {
    {1000.f, 1800.f, 0.f},
    {1000.f, 100.f, 0.f},
    {5000.f, 1800.f, 0.f},
  };
  std::vector<ZoneClass> out;
  classifyZones(positions, {2, 0, 1}, testConfig(), out);

  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0], ZoneClass::OUT_OF_RANGE);
  EXPECT_EQ(out[1], ZoneClass::GRASPABLE);
  EXPECT_EQ(out[2], ZoneClass::DANGEROUS);
}

TEST(ZoneClassifier, Distance)
{
  EXPECT_DOUBLE_EQ(distanceToOrigin({3.f, 4.f, 12.f}), 13.0);
  EXPECT_DOUBLE_EQ(distanceToOrigin({0.f, 0.f, 0.f}), 0.0);
}

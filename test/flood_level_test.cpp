#include <gtest/gtest.h>

#include "monitor/flood_level.h"
#include "monitor/height_estimator.h"

namespace {

TEST(HeightEstimatorTest, ContainerHeightMinusDistance) {
  EXPECT_FLOAT_EQ(15.0f, estimateWaterHeight(5.0f, 20.0f));
}

TEST(HeightEstimatorTest, NeverNegative) {
  EXPECT_FLOAT_EQ(0.0f, estimateWaterHeight(25.0f, 20.0f));
  EXPECT_FLOAT_EQ(0.0f, estimateWaterHeight(20.0f, 20.0f));
}

TEST(HeightEstimatorTest, RoundsToHundredths) {
  EXPECT_FLOAT_EQ(15.0f, estimateWaterHeight(4.999f, 20.0f));
  EXPECT_NEAR(12.35f, estimateWaterHeight(7.6543f, 20.0f), 0.0001f);
}

TEST(LevelClassifierTest, DefaultThreeTierTable) {
  MonitorConfig config;

  EXPECT_EQ(LEVEL_NONE, classifyHeight(12.0f, config));
  EXPECT_EQ(LEVEL_LOW, classifyHeight(13.0f, config));
  EXPECT_EQ(LEVEL_LOW, classifyHeight(14.99f, config));
  EXPECT_EQ(LEVEL_MEDIUM, classifyHeight(15.0f, config));
  EXPECT_EQ(LEVEL_CRITICAL, classifyHeight(18.0f, config));
  EXPECT_EQ(LEVEL_CRITICAL, classifyHeight(20.0f, config));
}

TEST(LevelClassifierTest, ZeroHeightIsNone) {
  MonitorConfig config;
  EXPECT_EQ(LEVEL_NONE, classifyHeight(0.0f, config));
}

TEST(LevelClassifierTest, CustomTableWithFiveTiers) {
  const LevelThreshold table[] = {
    {"watch", 2.0f},
    {"advisory", 4.0f},
    {"warning", 6.0f},
    {"severe", 8.0f},
    {"extreme", 10.0f},
  };

  EXPECT_EQ(0, classifyHeight(1.9f, table, 5));
  EXPECT_EQ(1, classifyHeight(2.0f, table, 5));
  EXPECT_EQ(3, classifyHeight(7.5f, table, 5));
  EXPECT_EQ(5, classifyHeight(50.0f, table, 5));
}

TEST(LevelClassifierTest, EmptyTableAlwaysNone) {
  EXPECT_EQ(LEVEL_NONE, classifyHeight(100.0f, nullptr, 0));
}

TEST(LevelClassifierTest, LevelNames) {
  MonitorConfig config;

  EXPECT_STREQ("none", levelName(LEVEL_NONE, config));
  EXPECT_STREQ("low", levelName(LEVEL_LOW, config));
  EXPECT_STREQ("medium", levelName(LEVEL_MEDIUM, config));
  EXPECT_STREQ("critical", levelName(LEVEL_CRITICAL, config));
  EXPECT_STREQ("none", levelName(7, config));
}

}  // namespace

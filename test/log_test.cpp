#include <gtest/gtest.h>

#include "fakes.h"
#include "log/log.h"
#include "monitor/clock.h"

namespace {

time_t g_epoch = 0;
unsigned long g_uptime = 0;

time_t fakeEpoch() { return g_epoch; }
unsigned long fakeUptime() { return g_uptime; }

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    g_epoch = 0;
    g_uptime = 5231;
    Log_SetTimeProvider(&fakeEpoch);
    Log_SetUptimeProvider(&fakeUptime);
  }

  void TearDown() override {
    Log_SetTimeProvider(nullptr);
    Log_SetUptimeProvider(nullptr);
  }
};

TEST_F(LogTest, UptimePrefixBeforeClockSync) {
  LogCapture log;
  Log_Measure("Distance: %.2f cm", 4.0f);

  ASSERT_EQ(1u, LogCapture::lines().size());
  EXPECT_EQ("ms=5231 [MEAS] Distance: 4.00 cm", LogCapture::lines()[0]);
}

TEST_F(LogTest, WallClockPrefixOnceSynced) {
  LogCapture log;
  g_epoch = 1760000000;
  Log_Action("Alert stored");

  ASSERT_EQ(1u, LogCapture::lines().size());
  EXPECT_EQ("2025-10-09 08:53:20 [ACT] Alert stored", LogCapture::lines()[0]);
}

TEST_F(LogTest, SameSyncBoundaryAsAlertTimestamps) {
  LogCapture log;

  g_epoch = MIN_VALID_EPOCH - 1;
  Log_Info("before");
  g_epoch = MIN_VALID_EPOCH;
  Log_Info("after");

  ASSERT_EQ(2u, LogCapture::lines().size());
  EXPECT_EQ("ms=5231 [INFO] before", LogCapture::lines()[0]);
  EXPECT_EQ("2021-01-01 00:00:00 [INFO] after", LogCapture::lines()[1]);
}

TEST_F(LogTest, TagsPerLevel) {
  LogCapture log;
  Log_Debug("d");
  Log_Info("i");
  Log_Warn("w");
  Log_Error("e");

  ASSERT_EQ(4u, LogCapture::lines().size());
  EXPECT_EQ("ms=5231 [DBG] d", LogCapture::lines()[0]);
  EXPECT_EQ("ms=5231 [INFO] i", LogCapture::lines()[1]);
  EXPECT_EQ("ms=5231 [WARN] w", LogCapture::lines()[2]);
  EXPECT_EQ("ms=5231 [ERR] e", LogCapture::lines()[3]);
}

TEST_F(LogTest, MinLevelFilters) {
  LogCapture log;
  Log_SetMinLevel(LOG_WARN);

  Log_Info("quiet");
  Log_Measure("quiet");
  Log_Warn("loud");

  ASSERT_EQ(1u, LogCapture::lines().size());
  EXPECT_TRUE(log.contains("[WARN] loud"));
}

TEST_F(LogTest, NoSinkDropsLines) {
  {
    LogCapture log;
  }
  Log_Error("nobody listening");
  EXPECT_TRUE(LogCapture::lines().empty());
}

}  // namespace

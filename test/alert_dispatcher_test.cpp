#include <gtest/gtest.h>

#include <climits>

#include "fakes.h"
#include "monitor/alert_dispatcher.h"

namespace {

class AlertDispatcherTest : public ::testing::Test {
protected:
  AlertDispatcherTest() : dispatcher(clock) {}

  void SetUp() override {
    clock.now_ms = 1000;
    clock.epoch_s = 1760000000;
    dispatcher.begin(config);
    dispatcher.setStore(&store);
    dispatcher.setAudioPlayer(&audio);
  }

  MonitorConfig config;
  ManualClock clock;
  RecordingStore store;
  RecordingAudio audio;
  AlertDispatcher dispatcher;
};

TEST_F(AlertDispatcherTest, StoresRecordPlaysAudioAndEntersCooldown) {
  DispatchResult result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  EXPECT_TRUE(result.dispatched);
  EXPECT_TRUE(result.stored);
  EXPECT_TRUE(result.played);

  ASSERT_EQ(1u, store.records.size());
  const AlertRecord& record = store.records[0];
  EXPECT_STREQ("flood", record.sensor_id);
  EXPECT_EQ(LEVEL_MEDIUM, record.level);
  EXPECT_STREQ("medium", record.level_name);
  EXPECT_FLOAT_EQ(16.0f, record.water_height_cm);
  EXPECT_FLOAT_EQ(4.0f, record.distance_cm);
  EXPECT_EQ(1760000000, record.timestamp);
  EXPECT_EQ(1000u, record.uptime_ms);
  EXPECT_EQ(3, record.confirmations);
  EXPECT_FALSE(record.escalated);

  ASSERT_EQ(1u, audio.paths.size());
  EXPECT_EQ("/alert.cue", audio.paths[0]);

  EXPECT_TRUE(dispatcher.isCoolingDown());
  EXPECT_EQ(1u, dispatcher.dispatchCount());
  EXPECT_EQ(LEVEL_MEDIUM, dispatcher.lastLevel());
}

TEST_F(AlertDispatcherTest, CooldownStrictlyGatesDispatch) {
  dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  clock.advance(config.cooldown_ms - 1);
  DispatchResult held = dispatcher.dispatch(LEVEL_CRITICAL, 19.0f, 1.5f, 3);

  EXPECT_FALSE(held.dispatched);
  EXPECT_FALSE(held.stored);
  EXPECT_FALSE(held.played);
  EXPECT_EQ(1u, store.records.size());
  EXPECT_EQ(1u, audio.paths.size());
  EXPECT_EQ(1u, dispatcher.cooldownRemainingMs());
  EXPECT_EQ(1u, dispatcher.dispatchCount());
}

TEST_F(AlertDispatcherTest, DispatchAllowedOnceCooldownElapses) {
  dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  clock.advance(config.cooldown_ms);
  EXPECT_FALSE(dispatcher.isCoolingDown());
  EXPECT_EQ(0u, dispatcher.cooldownRemainingMs());

  DispatchResult again = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);
  EXPECT_TRUE(again.dispatched);
  EXPECT_EQ(2u, store.records.size());
}

TEST_F(AlertDispatcherTest, CooldownStateTracksStartAndDuration) {
  EXPECT_FALSE(dispatcher.cooldown().active);

  dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  const CooldownState& cooldown = dispatcher.cooldown();
  EXPECT_TRUE(cooldown.active);
  EXPECT_EQ(1000u, cooldown.started_at_ms);
  EXPECT_EQ(config.cooldown_ms, cooldown.duration_ms);

  clock.advance(config.cooldown_ms);
  EXPECT_FALSE(dispatcher.isCoolingDown());
  EXPECT_FALSE(dispatcher.cooldown().active);
}

TEST_F(AlertDispatcherTest, CooldownSurvivesMillisWraparound) {
  clock.now_ms = ULONG_MAX - 2000;
  dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  clock.now_ms = ULONG_MAX;
  EXPECT_TRUE(dispatcher.isCoolingDown());

  // Counter wrapped: started + cooldown lands just past zero
  clock.now_ms = config.cooldown_ms - 2001;
  EXPECT_FALSE(dispatcher.isCoolingDown());
}

TEST_F(AlertDispatcherTest, StoreFailureIsNotFatal) {
  LogCapture log;
  store.succeed = false;

  DispatchResult result = dispatcher.dispatch(LEVEL_CRITICAL, 19.0f, 1.0f, 3);

  EXPECT_TRUE(result.dispatched);
  EXPECT_FALSE(result.stored);
  EXPECT_TRUE(result.played);
  EXPECT_TRUE(dispatcher.isCoolingDown());
  EXPECT_TRUE(log.contains("[ERR] Alert store failed for critical"));
}

TEST_F(AlertDispatcherTest, MissingAudioIsSkipped) {
  LogCapture log;
  audio.available = false;

  DispatchResult result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  EXPECT_TRUE(result.dispatched);
  EXPECT_TRUE(result.stored);
  EXPECT_FALSE(result.played);
  EXPECT_TRUE(dispatcher.isCoolingDown());
  EXPECT_TRUE(log.contains("Audio /alert.cue unavailable, skipping"));
}

TEST_F(AlertDispatcherTest, WorksWithoutCollaborators) {
  dispatcher.setStore(nullptr);
  dispatcher.setAudioPlayer(nullptr);

  DispatchResult result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  EXPECT_TRUE(result.dispatched);
  EXPECT_FALSE(result.stored);
  EXPECT_FALSE(result.played);
  EXPECT_STREQ("medium", result.record.level_name);
  EXPECT_TRUE(dispatcher.isCoolingDown());
}

TEST_F(AlertDispatcherTest, EmptyAudioPathDisablesPlayback) {
  MonitorConfig silent;
  silent.audio_path[0] = '\0';
  dispatcher.begin(silent);

  DispatchResult result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  EXPECT_TRUE(result.dispatched);
  EXPECT_FALSE(result.played);
  EXPECT_TRUE(audio.paths.empty());
}

TEST_F(AlertDispatcherTest, ZeroCooldownNeverHolds) {
  MonitorConfig noCooldown;
  noCooldown.cooldown_ms = 0;
  dispatcher.begin(noCooldown);

  EXPECT_TRUE(dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3).dispatched);
  EXPECT_FALSE(dispatcher.isCoolingDown());
  EXPECT_TRUE(dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3).dispatched);
}

TEST_F(AlertDispatcherTest, HigherLevelThanPreviousAlertIsAnEscalation) {
  dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);
  clock.advance(config.cooldown_ms);

  DispatchResult result = dispatcher.dispatch(LEVEL_CRITICAL, 19.0f, 1.0f, 3);
  EXPECT_TRUE(result.record.escalated);

  clock.advance(config.cooldown_ms);
  result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);
  EXPECT_FALSE(result.record.escalated);
}

TEST_F(AlertDispatcherTest, UnknownWallTimeLeavesTimestampZero) {
  clock.epoch_s = 0;

  DispatchResult result = dispatcher.dispatch(LEVEL_MEDIUM, 16.0f, 4.0f, 3);

  EXPECT_EQ(0, result.record.timestamp);
}

}  // namespace

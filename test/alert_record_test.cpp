#include <gtest/gtest.h>

#include <string.h>
#include <string>

#include "monitor/alert_record.h"
#include "monitor/clock.h"

namespace {

AlertRecord mediumAlert() {
  AlertRecord record;
  memset(&record, 0, sizeof(record));
  strcpy(record.sensor_id, "flood");
  record.level = LEVEL_MEDIUM;
  strcpy(record.level_name, "medium");
  record.water_height_cm = 16.5f;
  record.distance_cm = 3.5f;
  record.timestamp = 1760000000;
  record.uptime_ms = 5231;
  record.confirmations = 3;
  record.escalated = false;
  return record;
}

TEST(AlertRecordTest, SerializesAllFields) {
  char out[512];
  size_t written = serializeAlertRecord(mediumAlert(), out, sizeof(out));

  ASSERT_GT(written, 0u);
  EXPECT_EQ(strlen(out), written);
  EXPECT_STREQ("{\"sensor\":\"flood\",\"level\":\"medium\",\"level_index\":2,"
               "\"value\":16.5,\"distance\":3.5,"
               "\"timestamp\":\"2025-10-09T08:53:20Z\","
               "\"uptime_ms\":5231,\"confirmations\":3,\"escalated\":false}",
               out);
}

TEST(AlertRecordTest, OmitsTimestampBeforeClockSync) {
  AlertRecord record = mediumAlert();
  record.timestamp = 0;

  char out[512];
  ASSERT_GT(serializeAlertRecord(record, out, sizeof(out)), 0u);
  EXPECT_EQ(std::string::npos, std::string(out).find("timestamp"));
  EXPECT_NE(std::string::npos, std::string(out).find("\"uptime_ms\":5231"));
}

TEST(AlertRecordTest, TimestampStartsAtSyncedWallTime) {
  AlertRecord record = mediumAlert();
  char out[512];

  record.timestamp = MIN_VALID_EPOCH - 1;
  ASSERT_GT(serializeAlertRecord(record, out, sizeof(out)), 0u);
  EXPECT_EQ(std::string::npos, std::string(out).find("timestamp"));

  record.timestamp = MIN_VALID_EPOCH;
  ASSERT_GT(serializeAlertRecord(record, out, sizeof(out)), 0u);
  EXPECT_NE(std::string::npos, std::string(out).find("\"timestamp\":\"2021-01-01T00:00:00Z\""));
}

TEST(AlertRecordTest, ReportsEscalation) {
  AlertRecord record = mediumAlert();
  record.level = LEVEL_CRITICAL;
  strcpy(record.level_name, "critical");
  record.escalated = true;

  char out[512];
  ASSERT_GT(serializeAlertRecord(record, out, sizeof(out)), 0u);
  EXPECT_NE(std::string::npos, std::string(out).find("\"level\":\"critical\",\"level_index\":3"));
  EXPECT_NE(std::string::npos, std::string(out).find("\"escalated\":true"));
}

TEST(AlertRecordTest, ShortBufferWritesNothing) {
  char out[32];
  EXPECT_EQ(0u, serializeAlertRecord(mediumAlert(), out, sizeof(out)));
}

TEST(FormatISO8601Test, Utc) {
  char out[30];
  ASSERT_TRUE(formatISO8601(1760000000, out, sizeof(out)));
  EXPECT_STREQ("2025-10-09T08:53:20Z", out);
}

TEST(FormatISO8601Test, BufferTooSmall) {
  char out[10];
  EXPECT_FALSE(formatISO8601(1760000000, out, sizeof(out)));
}

}  // namespace

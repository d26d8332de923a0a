#include "alert_record.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include "clock.h"

bool formatISO8601(time_t t, char* out, size_t len) {
  struct tm timeinfo;
  if (!gmtime_r(&t, &timeinfo)) {
    return false;
  }

  int written = snprintf(out, len, "%04d-%02d-%02dT%02d:%02d:%02dZ",
                         timeinfo.tm_year + 1900,
                         timeinfo.tm_mon + 1,
                         timeinfo.tm_mday,
                         timeinfo.tm_hour,
                         timeinfo.tm_min,
                         timeinfo.tm_sec);

  return written > 0 && written < (int)len;
}

size_t serializeAlertRecord(const AlertRecord& record, char* out, size_t len) {
  StaticJsonDocument<512> doc;

  doc["sensor"] = record.sensor_id;
  doc["level"] = record.level_name;
  doc["level_index"] = record.level;
  doc["value"] = record.water_height_cm;
  doc["distance"] = record.distance_cm;

  // Only report wall time once NTP has synced
  if (record.timestamp >= MIN_VALID_EPOCH) {
    char isoTime[30];
    if (formatISO8601(record.timestamp, isoTime, sizeof(isoTime))) {
      doc["timestamp"] = isoTime;
    }
  }

  doc["uptime_ms"] = record.uptime_ms;
  doc["confirmations"] = record.confirmations;
  doc["escalated"] = record.escalated;

  if (measureJson(doc) >= len) {
    return 0;
  }
  return serializeJson(doc, out, len);
}

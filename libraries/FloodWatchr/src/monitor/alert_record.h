#ifndef ALERT_RECORD_H
#define ALERT_RECORD_H

#include <stddef.h>
#include <stdint.h>
#include <time.h>
#include "flood_level.h"

struct AlertRecord {
  char sensor_id[SENSOR_ID_LEN];
  FloodLevel level;
  char level_name[LEVEL_NAME_LEN];
  float water_height_cm;
  float distance_cm;
  time_t timestamp;         // seconds since epoch (UTC), 0 if unknown
  unsigned long uptime_ms;  // milliseconds since boot
  uint16_t confirmations;
  bool escalated;           // above the previous alert's level
};

// Persistence collaborator. Returns false when the record could not be
// handed over; the caller carries on either way.
class AlertStore {
public:
  virtual ~AlertStore() {}
  virtual bool store(const AlertRecord& record) = 0;
};

// Format time as ISO8601 (YYYY-MM-DDTHH:MM:SSZ)
bool formatISO8601(time_t t, char* out, size_t len);

// JSON document published for an alert. Returns the number of bytes
// written, 0 if out is too small.
size_t serializeAlertRecord(const AlertRecord& record, char* out, size_t len);

#endif // ALERT_RECORD_H

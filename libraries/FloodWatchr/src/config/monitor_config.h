#ifndef MONITOR_CONFIG_H
#define MONITOR_CONFIG_H

#include <stddef.h>
#include <stdint.h>

// Upper bounds for the fixed-size tables below
#define MAX_FLOOD_LEVELS 8
#define MAX_SAMPLES_PER_CYCLE 16
#define LEVEL_NAME_LEN 16
#define AUDIO_PATH_LEN 64
#define SENSOR_ID_LEN 24

// Default config file on LittleFS
#define MONITOR_CONFIG_PATH "/floodwatchr.json"

struct LevelThreshold {
  char name[LEVEL_NAME_LEN];
  float threshold_cm; // level applies from this water height upwards
};

class MonitorConfig {
public:
  MonitorConfig();

  // Container geometry
  float container_height_cm;

  // Flood level table, ascending. Level index 0 is "none", so
  // levels[0] describes level 1.
  uint8_t level_count;
  LevelThreshold levels[MAX_FLOOD_LEVELS];
  uint8_t min_alert_level;

  // Sampling
  uint8_t samples_per_cycle;
  float plausible_min_cm; // exclusive
  float plausible_max_cm; // exclusive
  float raw_to_cm;
  uint16_t reading_delay_ms;

  // Debounce and timing
  uint8_t confirm_count;
  uint32_t poll_interval_ms;
  uint32_t cooldown_ms;
  uint32_t startup_delay_ms;

  // Collaborators
  char audio_path[AUDIO_PATH_LEN]; // empty disables audio
  bool persistence_enabled;
  char sensor_id[SENSOR_ID_LEN];

  // Replaces the level table. Returns false if more than
  // MAX_FLOOD_LEVELS entries are given.
  bool setLevels(const LevelThreshold* table, uint8_t count);

  // Tier index for a configured name, 0 if unknown
  uint8_t levelIndex(const char* name) const;
};

// Checks every invariant the monitor relies on. On failure a human-readable
// reason is written to err.
bool validateMonitorConfig(const MonitorConfig& config, char* err, size_t errLen);

// Overlays a JSON document onto config. Keys that are absent keep their
// current value. The result is validated before returning true.
bool parseMonitorConfig(const char* json, size_t len, MonitorConfig& config,
                        char* err, size_t errLen);

#endif // MONITOR_CONFIG_H

#include "monitor_config.h"

#include <ArduinoJson.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

static const LevelThreshold kDefaultLevels[] = {
  {"low", 13.0f},
  {"medium", 15.0f},
  {"critical", 18.0f},
};

static void copyName(char* dst, size_t len, const char* src) {
  strncpy(dst, src, len - 1);
  dst[len - 1] = '\0';
}

MonitorConfig::MonitorConfig() :
  container_height_cm(20.0f),
  level_count(0),
  min_alert_level(2),
  samples_per_cycle(5),
  plausible_min_cm(1.0f),
  plausible_max_cm(400.0f),
  raw_to_cm(1.0f),
  reading_delay_ms(50),
  confirm_count(3),
  poll_interval_ms(2000),
  cooldown_ms(10000),
  startup_delay_ms(2000),
  persistence_enabled(true) {

  memset(levels, 0, sizeof(levels));
  setLevels(kDefaultLevels, sizeof(kDefaultLevels) / sizeof(kDefaultLevels[0]));

  copyName(audio_path, sizeof(audio_path), "/alert.cue");
  copyName(sensor_id, sizeof(sensor_id), "flood");
}

bool MonitorConfig::setLevels(const LevelThreshold* table, uint8_t count) {
  if (count > MAX_FLOOD_LEVELS) {
    return false;
  }
  for (uint8_t i = 0; i < count; i++) {
    copyName(levels[i].name, sizeof(levels[i].name), table[i].name);
    levels[i].threshold_cm = table[i].threshold_cm;
  }
  level_count = count;
  return true;
}

uint8_t MonitorConfig::levelIndex(const char* name) const {
  if (!name) {
    return 0;
  }
  for (uint8_t i = 0; i < level_count; i++) {
    if (strcmp(levels[i].name, name) == 0) {
      return i + 1;
    }
  }
  return 0;
}

bool validateMonitorConfig(const MonitorConfig& config, char* err, size_t errLen) {
  if (!isfinite(config.container_height_cm) || config.container_height_cm <= 0.0f) {
    snprintf(err, errLen, "container_height_cm must be a positive number");
    return false;
  }

  if (config.level_count == 0 || config.level_count > MAX_FLOOD_LEVELS) {
    snprintf(err, errLen, "levels must hold 1 to %d entries", MAX_FLOOD_LEVELS);
    return false;
  }

  for (uint8_t i = 0; i < config.level_count; i++) {
    const LevelThreshold& level = config.levels[i];
    if (level.name[0] == '\0') {
      snprintf(err, errLen, "level %d has no name", i + 1);
      return false;
    }
    if (!isfinite(level.threshold_cm) || level.threshold_cm <= 0.0f) {
      snprintf(err, errLen, "level '%s' threshold must be a positive number", level.name);
      return false;
    }
    if (i > 0 && level.threshold_cm <= config.levels[i - 1].threshold_cm) {
      snprintf(err, errLen, "level '%s' threshold %.2f is not above '%s' (%.2f)",
               level.name, level.threshold_cm,
               config.levels[i - 1].name, config.levels[i - 1].threshold_cm);
      return false;
    }
  }

  if (config.min_alert_level < 1 || config.min_alert_level > config.level_count) {
    snprintf(err, errLen, "min_alert_level must be between 1 and %d", config.level_count);
    return false;
  }

  if (config.samples_per_cycle < 1 || config.samples_per_cycle > MAX_SAMPLES_PER_CYCLE) {
    snprintf(err, errLen, "samples_per_cycle must be between 1 and %d", MAX_SAMPLES_PER_CYCLE);
    return false;
  }

  if (!isfinite(config.plausible_min_cm) || !isfinite(config.plausible_max_cm) ||
      config.plausible_min_cm < 0.0f || config.plausible_min_cm >= config.plausible_max_cm) {
    snprintf(err, errLen, "plausibility window (%.2f, %.2f) is invalid",
             config.plausible_min_cm, config.plausible_max_cm);
    return false;
  }

  if (!isfinite(config.raw_to_cm) || config.raw_to_cm <= 0.0f) {
    snprintf(err, errLen, "raw_to_cm must be a positive number");
    return false;
  }

  if (config.confirm_count < 1) {
    snprintf(err, errLen, "confirm_count must be at least 1");
    return false;
  }

  if (config.poll_interval_ms == 0) {
    snprintf(err, errLen, "poll_interval_ms must be greater than 0");
    return false;
  }

  return true;
}

// ==================== JSON helpers ====================

static bool readFloat(JsonObjectConst root, const char* key, float& out,
                      char* err, size_t errLen) {
  JsonVariantConst v = root[key];
  if (v.isNull()) {
    return true;
  }
  if (!v.is<float>()) {
    snprintf(err, errLen, "%s must be a number", key);
    return false;
  }
  out = v.as<float>();
  return true;
}

template <typename T>
static bool readUnsigned(JsonObjectConst root, const char* key, T& out, unsigned long maxValue,
                         char* err, size_t errLen) {
  JsonVariantConst v = root[key];
  if (v.isNull()) {
    return true;
  }
  if (!v.is<unsigned long>()) {
    snprintf(err, errLen, "%s must be a non-negative integer", key);
    return false;
  }
  unsigned long value = v.as<unsigned long>();
  if (value > maxValue) {
    snprintf(err, errLen, "%s must not exceed %lu", key, maxValue);
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

static bool readString(JsonObjectConst root, const char* key, char* out, size_t len,
                       char* err, size_t errLen) {
  JsonVariantConst v = root[key];
  if (v.isNull()) {
    return true;
  }
  if (!v.is<const char*>()) {
    snprintf(err, errLen, "%s must be a string", key);
    return false;
  }
  const char* value = v.as<const char*>();
  if (strlen(value) >= len) {
    snprintf(err, errLen, "%s is longer than %u characters", key, (unsigned)(len - 1));
    return false;
  }
  copyName(out, len, value);
  return true;
}

static bool readLevels(JsonObjectConst root, MonitorConfig& config, char* err, size_t errLen) {
  JsonVariantConst v = root["levels"];
  if (v.isNull()) {
    return true;
  }
  if (!v.is<JsonArrayConst>()) {
    snprintf(err, errLen, "levels must be an array");
    return false;
  }

  JsonArrayConst entries = v.as<JsonArrayConst>();
  if (entries.size() == 0 || entries.size() > MAX_FLOOD_LEVELS) {
    snprintf(err, errLen, "levels must hold 1 to %d entries", MAX_FLOOD_LEVELS);
    return false;
  }

  LevelThreshold table[MAX_FLOOD_LEVELS];
  uint8_t count = 0;
  for (JsonVariantConst entry : entries) {
    if (!entry.is<JsonObjectConst>()) {
      snprintf(err, errLen, "levels[%d] must be an object", count);
      return false;
    }
    JsonObjectConst level = entry.as<JsonObjectConst>();

    if (!level["name"].is<const char*>()) {
      snprintf(err, errLen, "levels[%d].name must be a string", count);
      return false;
    }
    const char* name = level["name"].as<const char*>();
    if (strlen(name) >= LEVEL_NAME_LEN) {
      snprintf(err, errLen, "levels[%d].name is too long", count);
      return false;
    }
    if (!level["threshold_cm"].is<float>()) {
      snprintf(err, errLen, "levels[%d].threshold_cm must be a number", count);
      return false;
    }

    copyName(table[count].name, sizeof(table[count].name), name);
    table[count].threshold_cm = level["threshold_cm"].as<float>();
    count++;
  }

  config.setLevels(table, count);
  return true;
}

static bool readMinAlertLevel(JsonObjectConst root, MonitorConfig& config,
                              char* err, size_t errLen) {
  JsonVariantConst v = root["min_alert_level"];
  if (v.isNull()) {
    return true;
  }

  if (v.is<const char*>()) {
    uint8_t index = config.levelIndex(v.as<const char*>());
    if (index == 0) {
      snprintf(err, errLen, "min_alert_level '%s' is not a configured level", v.as<const char*>());
      return false;
    }
    config.min_alert_level = index;
    return true;
  }

  return readUnsigned(root, "min_alert_level", config.min_alert_level, MAX_FLOOD_LEVELS, err, errLen);
}

bool parseMonitorConfig(const char* json, size_t len, MonitorConfig& config,
                        char* err, size_t errLen) {
  DynamicJsonDocument doc(2048);
  DeserializationError error = deserializeJson(doc, json, len);
  if (error) {
    snprintf(err, errLen, "JSON parse failed: %s", error.c_str());
    return false;
  }
  if (!doc.is<JsonObject>()) {
    snprintf(err, errLen, "config root must be an object");
    return false;
  }

  JsonObjectConst root = doc.as<JsonObjectConst>();
  MonitorConfig candidate = config;

  bool ok = readFloat(root, "container_height_cm", candidate.container_height_cm, err, errLen) &&
            readLevels(root, candidate, err, errLen);

  // Shortcut for the lowest tier, kept for configs that only move the
  // first alert line
  if (ok && !root["alert_height_cm"].isNull()) {
    ok = readFloat(root, "alert_height_cm", candidate.levels[0].threshold_cm, err, errLen);
  }

  ok = ok &&
       readMinAlertLevel(root, candidate, err, errLen) &&
       readUnsigned(root, "samples_per_cycle", candidate.samples_per_cycle, 255, err, errLen) &&
       readFloat(root, "plausible_min_cm", candidate.plausible_min_cm, err, errLen) &&
       readFloat(root, "plausible_max_cm", candidate.plausible_max_cm, err, errLen) &&
       readFloat(root, "raw_to_cm", candidate.raw_to_cm, err, errLen) &&
       readUnsigned(root, "reading_delay_ms", candidate.reading_delay_ms, 65535, err, errLen) &&
       readUnsigned(root, "confirm_count", candidate.confirm_count, 255, err, errLen) &&
       readUnsigned(root, "poll_interval_ms", candidate.poll_interval_ms, 0xFFFFFFFFUL, err, errLen) &&
       readUnsigned(root, "cooldown_ms", candidate.cooldown_ms, 0xFFFFFFFFUL, err, errLen) &&
       readUnsigned(root, "startup_delay_ms", candidate.startup_delay_ms, 0xFFFFFFFFUL, err, errLen) &&
       readString(root, "audio_path", candidate.audio_path, sizeof(candidate.audio_path), err, errLen) &&
       readString(root, "sensor_id", candidate.sensor_id, sizeof(candidate.sensor_id), err, errLen);

  if (ok && !root["persistence"].isNull()) {
    if (!root["persistence"].is<bool>()) {
      snprintf(err, errLen, "persistence must be true or false");
      ok = false;
    } else {
      candidate.persistence_enabled = root["persistence"].as<bool>();
    }
  }

  if (!ok || !validateMonitorConfig(candidate, err, errLen)) {
    return false;
  }

  config = candidate;
  return true;
}

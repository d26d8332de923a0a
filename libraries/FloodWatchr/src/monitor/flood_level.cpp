#include "flood_level.h"

FloodLevel classifyHeight(float heightCm, const LevelThreshold* levels, uint8_t count) {
  for (uint8_t i = count; i > 0; i--) {
    if (heightCm >= levels[i - 1].threshold_cm) {
      return i;
    }
  }
  return LEVEL_NONE;
}

FloodLevel classifyHeight(float heightCm, const MonitorConfig& config) {
  return classifyHeight(heightCm, config.levels, config.level_count);
}

const char* levelName(FloodLevel level, const MonitorConfig& config) {
  if (level == LEVEL_NONE || level > config.level_count) {
    return "none";
  }
  return config.levels[level - 1].name;
}

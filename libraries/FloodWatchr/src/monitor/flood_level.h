#ifndef FLOOD_LEVEL_H
#define FLOOD_LEVEL_H

#include <stdint.h>
#include "../config/monitor_config.h"

// Ordered flood level. 0 is always "none"; 1..level_count index the
// configured tiers, so comparisons follow severity.
typedef uint8_t FloodLevel;

// Indices of the default three-tier table
const FloodLevel LEVEL_NONE = 0;
const FloodLevel LEVEL_LOW = 1;
const FloodLevel LEVEL_MEDIUM = 2;
const FloodLevel LEVEL_CRITICAL = 3;

// Highest level whose threshold is <= heightCm, LEVEL_NONE below the
// first threshold. The table must be strictly ascending.
FloodLevel classifyHeight(float heightCm, const LevelThreshold* levels, uint8_t count);
FloodLevel classifyHeight(float heightCm, const MonitorConfig& config);

const char* levelName(FloodLevel level, const MonitorConfig& config);

#endif // FLOOD_LEVEL_H

#ifndef CONFIG_FILE_H
#define CONFIG_FILE_H

#include <Arduino.h>
#include "monitor_config.h"

// Loads the monitor configuration from LittleFS. A missing file leaves the
// defaults in place and succeeds; an unreadable, malformed or invalid file
// fails with the reason in err.
bool loadMonitorConfigFile(const char* path, MonitorConfig& config, char* err, size_t errLen);

#endif // CONFIG_FILE_H

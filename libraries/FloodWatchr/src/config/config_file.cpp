#include "config_file.h"

#include <LittleFS.h>

static const size_t kMaxConfigBytes = 2048;

bool loadMonitorConfigFile(const char* path, MonitorConfig& config, char* err, size_t errLen) {
  if (!LittleFS.begin()) {
    Serial.println("LittleFS mount failed, using built-in monitor defaults");
    return validateMonitorConfig(config, err, errLen);
  }

  if (!LittleFS.exists(path)) {
    Serial.print("No ");
    Serial.print(path);
    Serial.println(", using built-in monitor defaults");
    return validateMonitorConfig(config, err, errLen);
  }

  File f = LittleFS.open(path, "r");
  if (!f) {
    snprintf(err, errLen, "cannot open %s", path);
    return false;
  }

  size_t size = f.size();
  if (size == 0 || size > kMaxConfigBytes) {
    f.close();
    snprintf(err, errLen, "%s has unexpected size %u", path, (unsigned)size);
    return false;
  }

  String json = f.readString();
  f.close();

  Serial.print("Loaded monitor config from ");
  Serial.println(path);

  return parseMonitorConfig(json.c_str(), json.length(), config, err, errLen);
}

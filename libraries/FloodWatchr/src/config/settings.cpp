#include "settings.h"

Settings settings;

Settings::Settings() :
  mqtt_port(1883),
  _mqttConfigured(false) {
  clear();
}

void Settings::clear() {
  wifi_ssid[0] = '\0';
  wifi_password[0] = '\0';
  mqtt_server[0] = '\0';
  mqtt_user[0] = '\0';
  mqtt_password[0] = '\0';
  mqtt_port = 1883;
}

void Settings::begin() {
  load();
}

void Settings::load() {
  EEPROM.begin(EEPROM_SIZE);

  uint32_t magic = 0;
  EEPROM.get(SETTINGS_MAGIC_ADDR, magic);

  if (magic != SETTINGS_MAGIC) {
    // Fresh flash holds 0xFF everywhere, don't read it as credentials
    Serial.println("No stored settings, using defaults");
    clear();
    _mqttConfigured = false;
    EEPROM.end();
    return;
  }

  EEPROM.get(WIFI_SSID_ADDR, wifi_ssid);
  EEPROM.get(WIFI_PASS_ADDR, wifi_password);
  EEPROM.get(MQTT_ADDR, mqtt_server);
  EEPROM.get(MQTT_ADDR + 40, mqtt_user);
  EEPROM.get(MQTT_ADDR + 60, mqtt_password);
  EEPROM.get(MQTT_ADDR + 80, mqtt_port);

  // Ensure null termination
  wifi_ssid[sizeof(wifi_ssid) - 1] = '\0';
  wifi_password[sizeof(wifi_password) - 1] = '\0';
  mqtt_server[sizeof(mqtt_server) - 1] = '\0';
  mqtt_user[sizeof(mqtt_user) - 1] = '\0';
  mqtt_password[sizeof(mqtt_password) - 1] = '\0';

  if (mqtt_port <= 0 || mqtt_port > 65535) {
    mqtt_port = 1883;
  }

  _mqttConfigured = (strlen(mqtt_server) > 0);

  EEPROM.end();
}

bool Settings::save() {
  EEPROM.begin(EEPROM_SIZE);

  EEPROM.put(WIFI_SSID_ADDR, wifi_ssid);
  EEPROM.put(WIFI_PASS_ADDR, wifi_password);
  EEPROM.put(MQTT_ADDR, mqtt_server);
  EEPROM.put(MQTT_ADDR + 40, mqtt_user);
  EEPROM.put(MQTT_ADDR + 60, mqtt_password);
  EEPROM.put(MQTT_ADDR + 80, mqtt_port);
  EEPROM.put(SETTINGS_MAGIC_ADDR, (uint32_t)SETTINGS_MAGIC);

  bool ok = EEPROM.commit();
  if (!ok) {
    Serial.println("Settings save FAILED (EEPROM commit)");
  }
  EEPROM.end();

  _mqttConfigured = (strlen(mqtt_server) > 0);
  return ok;
}

bool Settings::isMqttConfigured() const {
  return _mqttConfigured;
}

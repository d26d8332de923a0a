#ifndef SETTINGS_H
#define SETTINGS_H

#include <Arduino.h>
#include <EEPROM.h>

// Firmware version
#define FIRMWARE_VERSION "1.0.0"

// EEPROM addresses and size
#define EEPROM_SIZE 256
#define WIFI_SSID_ADDR 100
#define WIFI_PASS_ADDR 140
#define MQTT_ADDR 0
#define SETTINGS_MAGIC_ADDR 200
#define SETTINGS_MAGIC 0x46570001UL // "FW" + layout version

// GPIO PIN definitions
#define TRIG_PIN 12   // D6
#define ECHO_PIN 13   // D7
#define BUZZER_PIN 14 // D5
#define LED_PIN 2     // D4 (Built-in LED, active low)

// MQTT topics
#define DEVICE_ID "floodwatchr"
#define MQTT_STATE_TOPIC "floodwatchr/" DEVICE_ID
#define MQTT_ALERT_TOPIC "floodwatchr/" DEVICE_ID "/alerts"
#define MQTT_COMMAND_TOPIC "floodwatchr/" DEVICE_ID "/set"
#define MQTT_AVAILABILITY_TOPIC "floodwatchr/" DEVICE_ID "/availability"

class Settings {
public:
  Settings();

  void begin();
  void load();
  bool save();

  // WiFi settings
  char wifi_ssid[40];
  char wifi_password[40];

  // MQTT settings (alert persistence)
  char mqtt_server[40];
  char mqtt_user[20];
  char mqtt_password[20];
  int mqtt_port;

  // Check if MQTT is configured
  bool isMqttConfigured() const;

private:
  bool _mqttConfigured;

  void clear();
};

extern Settings settings;

#endif // SETTINGS_H

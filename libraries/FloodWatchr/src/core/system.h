#ifndef SYSTEM_H
#define SYSTEM_H

#include <Arduino.h>
#include <ESP8266WiFi.h>
#include <WiFiManager.h>
#include <time.h>
#include "../config/settings.h"
#include "../monitor/clock.h"

class SystemManager {
public:
  SystemManager();

  void begin();
  void loop();

  // WiFi management
  bool isWiFiConnected() const;
  String getIPAddress() const;

  // Time synchronization
  bool isTimeSynced() const;
  time_t getCurrentTime() const;
  void startTimeSync();

  // LED management
  void updateLED(bool alertActive);

private:
  WiFiManager _wifiManager;
  bool _timeSyncStarted;
  bool _timeSynced;
  unsigned long _ledBlinkTimer;
  bool _ledState;

  void provisionWiFi();
  void checkTimeSync();
  void blinkLED(unsigned long intervalMs);
};

// Monitor clock on top of millis()/delay() and the NTP time
class ArduinoClock : public Clock {
public:
  unsigned long nowMs() override;
  void sleepMs(unsigned long ms) override;
  time_t epoch() override;
};

extern SystemManager systemManager;
extern ArduinoClock arduinoClock;

#endif // SYSTEM_H

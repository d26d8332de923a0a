#ifndef MQTT_CLIENT_H
#define MQTT_CLIENT_H

#include <Arduino.h>
#include <ESP8266WiFi.h>
#include <PubSubClient.h>
#include <WiFiClient.h>
#include <ArduinoJson.h>
#include <functional>
#include "../config/settings.h"
#include "../monitor/alert_record.h"
#include "../monitor/monitor_loop.h"

// Alert persistence over MQTT. Alerts go to MQTT_ALERT_TOPIC, a status
// document to MQTT_STATE_TOPIC every 10 s, and commands arrive on
// MQTT_COMMAND_TOPIC.
class MqttHandler : public AlertStore {
public:
  MqttHandler();

  void begin();
  void loop();

  // Connection management
  bool connect();

  // AlertStore
  bool store(const AlertRecord& record) override;

  // Status source for periodic publishing
  void attachMonitor(MonitorLoop* monitor, AlertDispatcher* dispatcher, const MonitorConfig* config);
  void publishState();

  // Command callback handling: "stop" / "start"
  typedef std::function<void(bool run)> CommandCallback;
  void setCommandCallback(CommandCallback callback);

private:
  WiFiClient _wifiClient;
  PubSubClient _client;
  CommandCallback _commandCallback;
  MonitorLoop* _monitor;
  AlertDispatcher* _dispatcher;
  const MonitorConfig* _config;
  unsigned long _lastStatusUpdate;
  unsigned long _lastConnectAttempt;
  const unsigned long _statusUpdateInterval = 10000; // 10 seconds
  const unsigned long _reconnectInterval = 5000;

  // Static callback wrapper for PubSubClient
  static void mqttCallbackWrapper(char* topic, byte* payload, unsigned int length);
  static MqttHandler* _instance;

  // Actual callback implementation
  void mqttCallback(char* topic, byte* payload, unsigned int length);
};

extern MqttHandler mqttClient;

#endif // MQTT_CLIENT_H

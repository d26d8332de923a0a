#include "mqtt_client.h"

#include "../core/system.h"

MqttHandler mqttClient;
MqttHandler* MqttHandler::_instance = nullptr;

MqttHandler::MqttHandler() :
  _client(_wifiClient),
  _monitor(nullptr),
  _dispatcher(nullptr),
  _config(nullptr),
  _lastStatusUpdate(0),
  _lastConnectAttempt(0) {
  _instance = this;
}

void MqttHandler::begin() {
  if (!settings.isMqttConfigured()) {
    Serial.println("MQTT not configured, skipping...");
    return;
  }

  _client.setServer(settings.mqtt_server, settings.mqtt_port);
  _client.setCallback(mqttCallbackWrapper);
  _client.setBufferSize(512);

  Serial.print("MQTT configured for: ");
  Serial.print(settings.mqtt_server);
  Serial.print(":");
  Serial.println(settings.mqtt_port);
}

void MqttHandler::loop() {
  if (!settings.isMqttConfigured()) {
    return;
  }

  if (!_client.connected()) {
    // Throttle reconnection attempts so the monitor keeps its cadence
    if (millis() - _lastConnectAttempt > _reconnectInterval) {
      connect();
      _lastConnectAttempt = millis();
    }
  }

  if (_client.connected()) {
    _client.loop();

    // Periodically publish state updates
    if (millis() - _lastStatusUpdate > _statusUpdateInterval) {
      publishState();
      _lastStatusUpdate = millis();
    }
  }
}

bool MqttHandler::connect() {
  if (_client.connected()) {
    return true;
  }
  if (!settings.isMqttConfigured() || WiFi.status() != WL_CONNECTED) {
    return false;
  }

  Serial.print("Connecting to MQTT...");

  String clientId = String(DEVICE_ID) + "_" + String(ESP.getChipId(), HEX);

  bool connected = false;
  if (strlen(settings.mqtt_user) > 0) {
    connected = _client.connect(clientId.c_str(), settings.mqtt_user, settings.mqtt_password,
                                MQTT_AVAILABILITY_TOPIC, 0, true, "offline");
  } else {
    connected = _client.connect(clientId.c_str(), nullptr, nullptr,
                                MQTT_AVAILABILITY_TOPIC, 0, true, "offline");
  }

  if (connected) {
    Serial.println("Connected!");

    _client.publish(MQTT_AVAILABILITY_TOPIC, "online", true);

    // Subscribe to command topic
    _client.subscribe(MQTT_COMMAND_TOPIC);
    Serial.print("Subscribed to: ");
    Serial.println(MQTT_COMMAND_TOPIC);

    // Publish initial state
    publishState();

    return true;
  } else {
    Serial.print("Failed, rc=");
    Serial.println(_client.state());
    return false;
  }
}

bool MqttHandler::store(const AlertRecord& record) {
  if (!connect()) {
    Serial.println("Alert not stored: MQTT unavailable");
    return false;
  }

  char buffer[512];
  size_t len = serializeAlertRecord(record, buffer, sizeof(buffer));
  if (len == 0) {
    Serial.println("Alert not stored: record too large");
    return false;
  }

  bool ok = _client.publish(MQTT_ALERT_TOPIC, buffer, false);

  Serial.print(ok ? "Published alert: " : "Alert publish FAILED: ");
  Serial.println(buffer);

  return ok;
}

void MqttHandler::attachMonitor(MonitorLoop* monitor, AlertDispatcher* dispatcher, const MonitorConfig* config) {
  _monitor = monitor;
  _dispatcher = dispatcher;
  _config = config;
}

void MqttHandler::publishState() {
  if (!_client.connected() || !_monitor || !_dispatcher || !_config) {
    return;
  }

  // Create JSON document
  StaticJsonDocument<512> doc;

  doc["firmware_version"] = FIRMWARE_VERSION;
  doc["monitoring"] = _monitor->isStopped() ? "stopped" : "running";

  const CycleReport& report = _monitor->lastReport();
  doc["last_cycle"] = cycleOutcomeName(report.outcome);
  if (report.outcome != CYCLE_SENSOR_FAULT) {
    doc["distance"] = report.distance_cm;
    doc["value"] = report.water_height_cm;
    doc["level"] = levelName(report.level, *_config);
  }
  doc["cycles"] = _monitor->cycleCount();
  doc["sensor_faults"] = _monitor->sensorFaults();

  doc["cooldown_ms"] = _dispatcher->cooldownRemainingMs();
  doc["alerts"] = _dispatcher->dispatchCount();
  doc["last_alert_level"] = levelName(_dispatcher->lastLevel(), *_config);

  doc["ip"] = systemManager.getIPAddress();
  doc["time_synced"] = systemManager.isTimeSynced();

  // Add link quality (WiFi RSSI mapped to 0-255)
  long rssi = WiFi.RSSI();
  int linkQuality = map(constrain(rssi, -100, -50), -100, -50, 0, 255);
  doc["linkquality"] = linkQuality;

  // Serialize to string
  char buffer[512];
  serializeJson(doc, buffer);

  _client.publish(MQTT_STATE_TOPIC, buffer, true);
}

void MqttHandler::setCommandCallback(CommandCallback callback) {
  _commandCallback = callback;
}

void MqttHandler::mqttCallbackWrapper(char* topic, byte* payload, unsigned int length) {
  if (_instance) {
    _instance->mqttCallback(topic, payload, length);
  }
}

void MqttHandler::mqttCallback(char* topic, byte* payload, unsigned int length) {
  Serial.print("MQTT message received on topic: ");
  Serial.println(topic);

  if (strcmp(topic, MQTT_COMMAND_TOPIC) != 0) {
    return;
  }

  // Parse JSON payload
  StaticJsonDocument<256> doc;
  DeserializationError error = deserializeJson(doc, payload, length);

  if (error) {
    Serial.print("JSON parse failed: ");
    Serial.println(error.c_str());
    return;
  }

  const char* command = doc["command"];
  if (!command) {
    Serial.println("Command message without \"command\" key ignored");
    return;
  }

  if (strcmp(command, "stop") == 0) {
    if (_commandCallback) {
      _commandCallback(false);
    }
  } else if (strcmp(command, "start") == 0) {
    if (_commandCallback) {
      _commandCallback(true);
    }
  } else {
    Serial.print("Unknown command: ");
    Serial.println(command);
    return;
  }

  publishState();
}

#include "system.h"

SystemManager systemManager;
ArduinoClock arduinoClock;

static bool shouldSaveSettings = false;

static void onPortalSave() {
  shouldSaveSettings = true;
}

SystemManager::SystemManager() :
  _timeSyncStarted(false),
  _timeSynced(false),
  _ledBlinkTimer(0),
  _ledState(false) {
}

void SystemManager::begin() {
  Serial.begin(115200);
  Serial.println("\n\nFloodWatchr v" FIRMWARE_VERSION);

  pinMode(LED_PIN, OUTPUT);
  digitalWrite(LED_PIN, HIGH); // LED OFF (active low)

  // Load settings
  settings.begin();

  provisionWiFi();

  if (WiFi.status() != WL_CONNECTED) {
    Serial.println("No WiFi, monitoring offline (alerts will not be stored)");
  } else {
    Serial.println("Connected!");
    Serial.print("IP Address: ");
    Serial.println(WiFi.localIP());
    digitalWrite(LED_PIN, LOW); // LED ON when connected
    startTimeSync();
  }
}

void SystemManager::provisionWiFi() {
  char port[8];
  snprintf(port, sizeof(port), "%d", settings.mqtt_port);

  WiFiManagerParameter mqttServer("mqtt_server", "MQTT server", settings.mqtt_server, sizeof(settings.mqtt_server) - 1);
  WiFiManagerParameter mqttPort("mqtt_port", "MQTT port", port, sizeof(port) - 1);
  WiFiManagerParameter mqttUser("mqtt_user", "MQTT user", settings.mqtt_user, sizeof(settings.mqtt_user) - 1);
  WiFiManagerParameter mqttPassword("mqtt_pass", "MQTT password", settings.mqtt_password, sizeof(settings.mqtt_password) - 1);

  _wifiManager.addParameter(&mqttServer);
  _wifiManager.addParameter(&mqttPort);
  _wifiManager.addParameter(&mqttUser);
  _wifiManager.addParameter(&mqttPassword);
  _wifiManager.setSaveConfigCallback(onPortalSave);
  // Portal gives up after 3 minutes and monitoring starts offline
  _wifiManager.setConfigPortalTimeout(180);

  Serial.println("Connecting to WiFi (portal: FloodWatchr-Setup)...");
  bool connected = _wifiManager.autoConnect("FloodWatchr-Setup");

  if (shouldSaveSettings) {
    strncpy(settings.mqtt_server, mqttServer.getValue(), sizeof(settings.mqtt_server) - 1);
    strncpy(settings.mqtt_user, mqttUser.getValue(), sizeof(settings.mqtt_user) - 1);
    strncpy(settings.mqtt_password, mqttPassword.getValue(), sizeof(settings.mqtt_password) - 1);
    int newPort = atoi(mqttPort.getValue());
    settings.mqtt_port = (newPort > 0 && newPort <= 65535) ? newPort : 1883;

    if (connected) {
      strncpy(settings.wifi_ssid, WiFi.SSID().c_str(), sizeof(settings.wifi_ssid) - 1);
      strncpy(settings.wifi_password, WiFi.psk().c_str(), sizeof(settings.wifi_password) - 1);
    }

    shouldSaveSettings = false;
    if (settings.save()) {
      Serial.println("Portal settings saved");
    } else {
      Serial.println("Portal settings not saved, they will be lost on reboot");
    }
  }
}

void SystemManager::loop() {
  if (WiFi.status() == WL_CONNECTED) {
    if (!_timeSyncStarted) {
      startTimeSync();
    }
    if (!_timeSynced) {
      checkTimeSync();
    }
  }
}

bool SystemManager::isWiFiConnected() const {
  return WiFi.status() == WL_CONNECTED;
}

String SystemManager::getIPAddress() const {
  return WiFi.localIP().toString();
}

bool SystemManager::isTimeSynced() const {
  return _timeSynced;
}

time_t SystemManager::getCurrentTime() const {
  return time(nullptr);
}

void SystemManager::startTimeSync() {
  if (_timeSyncStarted) return;

  Serial.println("Starting time sync with NTP...");
  configTime(0, 0, "pool.ntp.org", "time.nist.gov");
  _timeSyncStarted = true;
}

void SystemManager::checkTimeSync() {
  time_t now = time(nullptr);
  if (now >= MIN_VALID_EPOCH) {
    _timeSynced = true;
    Serial.print("Time synced: ");
    Serial.println(ctime(&now));
  }
}

void SystemManager::updateLED(bool alertActive) {
  if (alertActive) {
    // Blink fast while an alert cooldown is running
    blinkLED(100);
  } else if (!isWiFiConnected()) {
    // Blink slowly when disconnected
    blinkLED(1000);
  } else {
    // Solid on when connected and quiet
    digitalWrite(LED_PIN, LOW);
  }
}

void SystemManager::blinkLED(unsigned long intervalMs) {
  if (millis() - _ledBlinkTimer > intervalMs) {
    _ledState = !_ledState;
    digitalWrite(LED_PIN, _ledState ? LOW : HIGH);
    _ledBlinkTimer = millis();
  }
}

unsigned long ArduinoClock::nowMs() {
  return millis();
}

void ArduinoClock::sleepMs(unsigned long ms) {
  // delay() yields to the WiFi stack on ESP8266
  delay(ms);
}

time_t ArduinoClock::epoch() {
  time_t now = systemManager.getCurrentTime();
  return now >= MIN_VALID_EPOCH ? now : 0;
}

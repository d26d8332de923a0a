#include "ultrasonic.h"

UltrasonicSensor ultrasonic(TRIG_PIN, ECHO_PIN);

UltrasonicSensor::UltrasonicSensor(uint8_t trigPin, uint8_t echoPin) :
  _trigPin(trigPin),
  _echoPin(echoPin) {
}

void UltrasonicSensor::begin() {
  pinMode(_trigPin, OUTPUT);
  pinMode(_echoPin, INPUT);
  digitalWrite(_trigPin, LOW);

  Serial.println("Ultrasonic sensor initialized");
}

float UltrasonicSensor::readDistanceRaw() {
  // 10us trigger pulse
  digitalWrite(_trigPin, LOW);
  delayMicroseconds(2);
  digitalWrite(_trigPin, HIGH);
  delayMicroseconds(10);
  digitalWrite(_trigPin, LOW);

  unsigned long echoMicros = pulseIn(_echoPin, HIGH, kEchoTimeoutUs);
  yield();

  if (echoMicros == 0) {
    return 0.0f;
  }

  // Speed of sound 343 m/s, halved for the round trip
  return (echoMicros / 2.0f) * 0.0343f;
}

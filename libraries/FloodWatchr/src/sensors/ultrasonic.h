#ifndef ULTRASONIC_H
#define ULTRASONIC_H

#include <Arduino.h>
#include "../config/settings.h"
#include "../monitor/sampler.h"

// HC-SR04 style sensor on a trigger/echo pin pair. Reports centimeters;
// an echo timeout comes back as 0 and is filtered out by the Sampler.
class UltrasonicSensor : public DistanceSensor {
public:
  UltrasonicSensor(uint8_t trigPin, uint8_t echoPin);

  void begin();

  float readDistanceRaw() override;

private:
  uint8_t _trigPin;
  uint8_t _echoPin;

  static const unsigned long kEchoTimeoutUs = 30000; // ~5 m round trip
};

extern UltrasonicSensor ultrasonic;

#endif // ULTRASONIC_H

#ifndef SAMPLER_H
#define SAMPLER_H

#include <stdint.h>
#include "clock.h"
#include "../config/monitor_config.h"

// One raw distance reading per call, in the sensor's own unit. Glitches
// show up as 0, negative or far out-of-range values.
class DistanceSensor {
public:
  virtual ~DistanceSensor() {}
  virtual float readDistanceRaw() = 0;
};

struct Sample {
  bool valid;
  float distance_cm; // only meaningful when valid
  uint8_t accepted;  // raw readings inside the plausibility window
};

class Sampler {
public:
  Sampler(DistanceSensor& sensor, Clock& clock);

  void begin(const MonitorConfig& config);

  // Median of the plausible readings of one burst, or an invalid Sample
  // when none survived.
  Sample acquire();

private:
  DistanceSensor& _sensor;
  Clock& _clock;
  uint8_t _samplesPerCycle;
  float _minCm;
  float _maxCm;
  float _rawToCm;
  uint16_t _readingDelayMs;
};

// Sorts values in place. count must be > 0.
float medianOf(float* values, uint8_t count);

#endif // SAMPLER_H

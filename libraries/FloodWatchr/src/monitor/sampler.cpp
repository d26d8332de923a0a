#include "sampler.h"

#include <algorithm>

Sampler::Sampler(DistanceSensor& sensor, Clock& clock) :
  _sensor(sensor),
  _clock(clock),
  _samplesPerCycle(5),
  _minCm(1.0f),
  _maxCm(400.0f),
  _rawToCm(1.0f),
  _readingDelayMs(50) {
}

void Sampler::begin(const MonitorConfig& config) {
  _samplesPerCycle = config.samples_per_cycle;
  if (_samplesPerCycle > MAX_SAMPLES_PER_CYCLE) {
    _samplesPerCycle = MAX_SAMPLES_PER_CYCLE;
  }
  _minCm = config.plausible_min_cm;
  _maxCm = config.plausible_max_cm;
  _rawToCm = config.raw_to_cm;
  _readingDelayMs = config.reading_delay_ms;
}

Sample Sampler::acquire() {
  float readings[MAX_SAMPLES_PER_CYCLE];
  uint8_t accepted = 0;

  for (uint8_t i = 0; i < _samplesPerCycle; i++) {
    float d = _sensor.readDistanceRaw() * _rawToCm;

    // Also rejects NaN
    if (d > _minCm && d < _maxCm) {
      readings[accepted++] = d;
    }

    // Let the previous echo die out before the next ping
    if (i + 1 < _samplesPerCycle && _readingDelayMs > 0) {
      _clock.sleepMs(_readingDelayMs);
    }
  }

  Sample sample;
  sample.accepted = accepted;
  sample.valid = accepted > 0;
  sample.distance_cm = sample.valid ? medianOf(readings, accepted) : 0.0f;
  return sample;
}

float medianOf(float* values, uint8_t count) {
  std::sort(values, values + count);
  if (count % 2 == 1) {
    return values[count / 2];
  }
  return (values[count / 2 - 1] + values[count / 2]) / 2.0f;
}

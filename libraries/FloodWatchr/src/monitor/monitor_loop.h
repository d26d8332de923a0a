#ifndef MONITOR_LOOP_H
#define MONITOR_LOOP_H

#include <stdint.h>
#include "alert_dispatcher.h"
#include "confirmation.h"
#include "sampler.h"

enum CycleOutcome {
  CYCLE_SENSOR_FAULT = 0, // no plausible reading, state untouched
  CYCLE_MONITORED,        // measured and fed to the tracker
  CYCLE_COOLDOWN,         // measured while an alert cooldown is running
  CYCLE_DISPATCHED        // tracker confirmed and an alert went out
};

struct CycleReport {
  CycleOutcome outcome;
  float distance_cm;
  float water_height_cm;
  FloodLevel level;
  uint8_t accepted;
};

class MonitorLoop {
public:
  MonitorLoop(Sampler& sampler, ConfirmationTracker& tracker,
              AlertDispatcher& dispatcher, Clock& clock);

  // Configures sampler, tracker and dispatcher as well
  void begin(const MonitorConfig& config);

  // Call from the sketch loop(). Runs a cycle when one is due and returns
  // true if it did.
  bool loop();

  // One full sampling/decision cycle, regardless of schedule
  CycleReport cycle();

  // External interruption: no cycle runs after this until resume()
  void requestStop();
  void resume();
  bool isStopped() const;

  const CycleReport& lastReport() const;
  uint32_t cycleCount() const;
  uint32_t sensorFaults() const;

private:
  Sampler& _sampler;
  ConfirmationTracker& _tracker;
  AlertDispatcher& _dispatcher;
  Clock& _clock;
  MonitorConfig _config;

  bool _started;
  bool _stopped;
  bool _wasCoolingDown;
  unsigned long _lastCycleAt;
  unsigned long _waitMs;

  CycleReport _lastReport;
  uint32_t _cycleCount;
  uint32_t _sensorFaults;
};

const char* cycleOutcomeName(CycleOutcome outcome);

#endif // MONITOR_LOOP_H

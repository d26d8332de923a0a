#include "monitor_loop.h"

#include "height_estimator.h"
#include "../log/log.h"

MonitorLoop::MonitorLoop(Sampler& sampler, ConfirmationTracker& tracker,
                         AlertDispatcher& dispatcher, Clock& clock) :
  _sampler(sampler),
  _tracker(tracker),
  _dispatcher(dispatcher),
  _clock(clock),
  _started(false),
  _stopped(false),
  _wasCoolingDown(false),
  _lastCycleAt(0),
  _waitMs(0),
  _cycleCount(0),
  _sensorFaults(0) {
  _lastReport.outcome = CYCLE_SENSOR_FAULT;
  _lastReport.distance_cm = 0.0f;
  _lastReport.water_height_cm = 0.0f;
  _lastReport.level = LEVEL_NONE;
  _lastReport.accepted = 0;
}

void MonitorLoop::begin(const MonitorConfig& config) {
  _config = config;
  _sampler.begin(config);
  _tracker.begin(config);
  _dispatcher.begin(config);

  _started = true;
  _stopped = false;
  _wasCoolingDown = false;
  _lastCycleAt = _clock.nowMs();
  _waitMs = config.startup_delay_ms;

  Log_Info("FloodWatchr %d-level monitoring started, alerts from %s after %d confirmations",
           config.level_count, levelName(config.min_alert_level, config), config.confirm_count);
}

bool MonitorLoop::loop() {
  if (!_started || _stopped) {
    return false;
  }

  if (_clock.nowMs() - _lastCycleAt < _waitMs) {
    return false;
  }

  cycle();
  _lastCycleAt = _clock.nowMs();
  _waitMs = _config.poll_interval_ms;
  return true;
}

CycleReport MonitorLoop::cycle() {
  CycleReport report;
  report.distance_cm = 0.0f;
  report.water_height_cm = 0.0f;
  report.level = LEVEL_NONE;

  _cycleCount++;

  Sample sample = _sampler.acquire();
  report.accepted = sample.accepted;

  if (!sample.valid) {
    _sensorFaults++;
    Log_Warn("Sensor read failed, retrying...");
    report.outcome = CYCLE_SENSOR_FAULT;
    _lastReport = report;
    return report;
  }

  report.distance_cm = sample.distance_cm;
  report.water_height_cm = estimateWaterHeight(sample.distance_cm, _config.container_height_cm);
  report.level = classifyHeight(report.water_height_cm, _config);

  Log_Measure("Distance: %.2f cm | Water Height: %.2f cm | Level: %s",
              report.distance_cm, report.water_height_cm, levelName(report.level, _config));

  if (_dispatcher.isCoolingDown()) {
    _wasCoolingDown = true;
    report.outcome = CYCLE_COOLDOWN;
    _lastReport = report;
    return report;
  }

  if (_wasCoolingDown) {
    _wasCoolingDown = false;
    _tracker.reset();
  }

  Confirmation confirmation = _tracker.observe(report.level);
  if (!confirmation.confirmed) {
    report.outcome = CYCLE_MONITORED;
    _lastReport = report;
    return report;
  }

  DispatchResult result = _dispatcher.dispatch(confirmation.level, report.water_height_cm,
                                               report.distance_cm, confirmation.count);
  report.outcome = result.dispatched ? CYCLE_DISPATCHED : CYCLE_COOLDOWN;
  _lastReport = report;
  return report;
}

void MonitorLoop::requestStop() {
  if (_stopped) {
    return;
  }
  _stopped = true;
  Log_Info("FloodWatchr stopped by user.");
}

void MonitorLoop::resume() {
  if (!_started || !_stopped) {
    return;
  }
  _stopped = false;
  _tracker.reset();
  _lastCycleAt = _clock.nowMs();
  _waitMs = 0;
  Log_Info("FloodWatchr monitoring resumed");
}

bool MonitorLoop::isStopped() const {
  return _stopped;
}

const CycleReport& MonitorLoop::lastReport() const {
  return _lastReport;
}

uint32_t MonitorLoop::cycleCount() const {
  return _cycleCount;
}

uint32_t MonitorLoop::sensorFaults() const {
  return _sensorFaults;
}

const char* cycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CYCLE_SENSOR_FAULT:
      return "sensor_fault";
    case CYCLE_MONITORED:
      return "monitored";
    case CYCLE_COOLDOWN:
      return "cooldown";
    case CYCLE_DISPATCHED:
      return "dispatched";
  }
  return "unknown";
}

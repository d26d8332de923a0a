#include "alert_dispatcher.h"

#include <string.h>
#include "../log/log.h"

AlertDispatcher::AlertDispatcher(Clock& clock) :
  _clock(clock),
  _store(nullptr),
  _player(nullptr),
  _lastLevel(LEVEL_NONE),
  _dispatchCount(0) {
  _cooldown.active = false;
  _cooldown.started_at_ms = 0;
  _cooldown.duration_ms = 0;
}

void AlertDispatcher::begin(const MonitorConfig& config) {
  _config = config;
  _cooldown.active = false;
  _cooldown.duration_ms = config.cooldown_ms;
}

void AlertDispatcher::setStore(AlertStore* store) {
  _store = store;
}

void AlertDispatcher::setAudioPlayer(AudioPlayer* player) {
  _player = player;
}

DispatchResult AlertDispatcher::dispatch(FloodLevel level, float waterHeightCm, float distanceCm,
                                         uint16_t confirmations) {
  DispatchResult result;
  result.dispatched = false;
  result.stored = false;
  result.played = false;
  memset(&result.record, 0, sizeof(result.record));

  if (isCoolingDown()) {
    Log_Debug("Alert %s suppressed, cooldown %lu ms left",
              levelName(level, _config), cooldownRemainingMs());
    return result;
  }

  result.record = buildRecord(level, waterHeightCm, distanceCm, confirmations);
  result.dispatched = true;
  const AlertRecord& record = result.record;

  // 1) persistence
  if (_store) {
    result.stored = _store->store(record);
    if (result.stored) {
      Log_Action("Alert stored: %s | Water Height: %.2f cm", record.level_name, record.water_height_cm);
    } else {
      Log_Error("Alert store failed for %s, continuing", record.level_name);
    }
  } else {
    Log_Info("No alert store attached, %s alert not persisted", record.level_name);
  }

  // 2) audio cue
  if (_player && _config.audio_path[0] != '\0') {
    result.played = _player->play(_config.audio_path);
    if (result.played) {
      Log_Action("Played alert audio %s", _config.audio_path);
    } else {
      Log_Warn("Audio %s unavailable, skipping", _config.audio_path);
    }
  }

  // 3) cooldown, entered even when the collaborators failed
  _cooldown.active = _config.cooldown_ms > 0;
  _cooldown.started_at_ms = _clock.nowMs();
  _cooldown.duration_ms = _config.cooldown_ms;
  if (_cooldown.active) {
    Log_Action("Cooldown for %lu ms", _cooldown.duration_ms);
  }

  _lastLevel = level;
  _dispatchCount++;
  return result;
}

AlertRecord AlertDispatcher::buildRecord(FloodLevel level, float waterHeightCm, float distanceCm,
                                         uint16_t confirmations) {
  AlertRecord record;
  memset(&record, 0, sizeof(record));

  strncpy(record.sensor_id, _config.sensor_id, sizeof(record.sensor_id) - 1);
  record.level = level;
  strncpy(record.level_name, levelName(level, _config), sizeof(record.level_name) - 1);
  record.water_height_cm = waterHeightCm;
  record.distance_cm = distanceCm;
  record.timestamp = _clock.epoch();
  record.uptime_ms = _clock.nowMs();
  record.confirmations = confirmations;
  record.escalated = _dispatchCount > 0 && level > _lastLevel;

  if (record.escalated) {
    Log_Warn("Flood escalated: %s -> %s", levelName(_lastLevel, _config), record.level_name);
  }
  Log_Action("Flood alert: %s | Water Height: %.2f cm | Distance: %.2f cm",
             record.level_name, waterHeightCm, distanceCm);

  return record;
}

bool AlertDispatcher::isCoolingDown() {
  if (_cooldown.active && _clock.nowMs() - _cooldown.started_at_ms >= _cooldown.duration_ms) {
    _cooldown.active = false;
    Log_Action("Cooldown over, alerts re-armed");
  }
  return _cooldown.active;
}

const CooldownState& AlertDispatcher::cooldown() const {
  return _cooldown;
}

unsigned long AlertDispatcher::cooldownRemainingMs() {
  if (!isCoolingDown()) {
    return 0;
  }
  return _cooldown.duration_ms - (_clock.nowMs() - _cooldown.started_at_ms);
}

FloodLevel AlertDispatcher::lastLevel() const {
  return _lastLevel;
}

uint32_t AlertDispatcher::dispatchCount() const {
  return _dispatchCount;
}

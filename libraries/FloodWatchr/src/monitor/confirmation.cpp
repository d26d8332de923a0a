#include "confirmation.h"

ConfirmationTracker::ConfirmationTracker() :
  _confirmCount(3),
  _minAlertLevel(LEVEL_MEDIUM) {
  reset();
}

void ConfirmationTracker::begin(const MonitorConfig& config) {
  begin(config.confirm_count, config.min_alert_level);
}

void ConfirmationTracker::begin(uint8_t confirmCount, FloodLevel minAlertLevel) {
  _confirmCount = confirmCount > 0 ? confirmCount : 1;
  _minAlertLevel = minAlertLevel;
  reset();
}

Confirmation ConfirmationTracker::observe(FloodLevel level) {
  Confirmation result;
  result.confirmed = false;
  result.level = LEVEL_NONE;
  result.count = 0;

  if (level == LEVEL_NONE || level < _minAlertLevel) {
    reset();
    return result;
  }

  if (level == _state.current_level) {
    _state.consecutive_count++;
  } else {
    // The cycle that changes tier counts as the first of the new streak
    _state.current_level = level;
    _state.consecutive_count = 1;
  }

  if (_state.consecutive_count >= _confirmCount) {
    result.confirmed = true;
    result.level = _state.current_level;
    result.count = _state.consecutive_count;
    reset();
  }

  return result;
}

void ConfirmationTracker::reset() {
  _state.current_level = LEVEL_NONE;
  _state.consecutive_count = 0;
}

const ConfirmationState& ConfirmationTracker::state() const {
  return _state;
}

uint8_t ConfirmationTracker::confirmCount() const {
  return _confirmCount;
}

FloodLevel ConfirmationTracker::minAlertLevel() const {
  return _minAlertLevel;
}

#ifndef CONFIRMATION_H
#define CONFIRMATION_H

#include <stdint.h>
#include "flood_level.h"

struct ConfirmationState {
  FloodLevel current_level;
  uint16_t consecutive_count;
};

struct Confirmation {
  bool confirmed;
  FloodLevel level;   // level that completed the streak
  uint16_t count;     // streak length when it fired
};

// Debounce for alert-eligible levels. A level has to be observed on
// confirm_count consecutive cycles before it is confirmed. A change to a
// different eligible level restarts the streak at 1; anything below
// min_alert_level clears it. Firing clears it as well, so a persisting
// flood needs a fresh streak for the next alert.
class ConfirmationTracker {
public:
  ConfirmationTracker();

  void begin(const MonitorConfig& config);
  void begin(uint8_t confirmCount, FloodLevel minAlertLevel);

  Confirmation observe(FloodLevel level);
  void reset();

  const ConfirmationState& state() const;
  uint8_t confirmCount() const;
  FloodLevel minAlertLevel() const;

private:
  ConfirmationState _state;
  uint8_t _confirmCount;
  FloodLevel _minAlertLevel;
};

#endif // CONFIRMATION_H

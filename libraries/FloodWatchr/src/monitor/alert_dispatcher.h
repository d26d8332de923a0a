#ifndef ALERT_DISPATCHER_H
#define ALERT_DISPATCHER_H

#include <stdint.h>
#include "alert_record.h"
#include "clock.h"
#include "flood_level.h"

// Audio collaborator. Returns false when the resource is missing or could
// not be played.
class AudioPlayer {
public:
  virtual ~AudioPlayer() {}
  virtual bool play(const char* resourcePath) = 0;
};

struct CooldownState {
  bool active;
  unsigned long started_at_ms;
  unsigned long duration_ms;
};

struct DispatchResult {
  bool dispatched; // false when held back by the cooldown
  bool stored;
  bool played;
  AlertRecord record;
};

class AlertDispatcher {
public:
  explicit AlertDispatcher(Clock& clock);

  void begin(const MonitorConfig& config);

  // Either collaborator may be null: no store means persistence is
  // disabled, no player means audio is disabled.
  void setStore(AlertStore* store);
  void setAudioPlayer(AudioPlayer* player);

  DispatchResult dispatch(FloodLevel level, float waterHeightCm, float distanceCm,
                          uint16_t confirmations);

  // Clears the cooldown once it has run out
  bool isCoolingDown();
  const CooldownState& cooldown() const;
  unsigned long cooldownRemainingMs();

  FloodLevel lastLevel() const;
  uint32_t dispatchCount() const;

private:
  Clock& _clock;
  MonitorConfig _config;
  AlertStore* _store;
  AudioPlayer* _player;
  CooldownState _cooldown;
  FloodLevel _lastLevel;
  uint32_t _dispatchCount;

  AlertRecord buildRecord(FloodLevel level, float waterHeightCm, float distanceCm,
                          uint16_t confirmations);
};

#endif // ALERT_DISPATCHER_H

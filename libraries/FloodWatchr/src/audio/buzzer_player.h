#ifndef BUZZER_PLAYER_H
#define BUZZER_PLAYER_H

#include <Arduino.h>
#include "cue.h"
#include "../config/settings.h"
#include "../monitor/alert_dispatcher.h"

// Plays cue files from LittleFS on a passive piezo buzzer. Playback blocks
// for the length of the cue.
class BuzzerAudioPlayer : public AudioPlayer {
public:
  explicit BuzzerAudioPlayer(uint8_t pin);

  void begin();

  bool play(const char* resourcePath) override;

  // Short chirp at boot
  void beep(uint16_t frequencyHz, uint16_t durationMs);

private:
  uint8_t _pin;
  bool _fsMounted;

  static const uint16_t kMaxNotes = 64;
};

extern BuzzerAudioPlayer buzzer;

#endif // BUZZER_PLAYER_H

#include "buzzer_player.h"

#include <LittleFS.h>

BuzzerAudioPlayer buzzer(BUZZER_PIN);

BuzzerAudioPlayer::BuzzerAudioPlayer(uint8_t pin) :
  _pin(pin),
  _fsMounted(false) {
}

void BuzzerAudioPlayer::begin() {
  pinMode(_pin, OUTPUT);
  digitalWrite(_pin, LOW);

  _fsMounted = LittleFS.begin();
  if (!_fsMounted) {
    Serial.println("Buzzer: LittleFS not mounted, alert cues unavailable");
  }
}

bool BuzzerAudioPlayer::play(const char* resourcePath) {
  if (!_fsMounted || !LittleFS.exists(resourcePath)) {
    Serial.print("Audio file missing, skipping: ");
    Serial.println(resourcePath);
    return false;
  }

  File f = LittleFS.open(resourcePath, "r");
  if (!f) {
    Serial.print("Cannot open audio cue: ");
    Serial.println(resourcePath);
    return false;
  }

  Serial.println("Playing alert audio for flood level!");

  uint16_t played = 0;
  uint16_t lineNo = 0;
  while (f.available() && played < kMaxNotes) {
    String line = f.readStringUntil('\n');
    lineNo++;

    CueNote note;
    CueLineResult result = parseCueLine(line.c_str(), note);
    if (result == CUE_SKIP) {
      continue;
    }
    if (result == CUE_INVALID) {
      Serial.print("Bad cue line ");
      Serial.print(lineNo);
      Serial.print(" in ");
      Serial.println(resourcePath);
      continue;
    }

    if (note.frequency_hz > 0) {
      tone(_pin, note.frequency_hz, note.duration_ms);
    } else {
      noTone(_pin);
    }
    delay(note.duration_ms);
    played++;
  }

  noTone(_pin);
  digitalWrite(_pin, LOW);
  f.close();

  return played > 0;
}

void BuzzerAudioPlayer::beep(uint16_t frequencyHz, uint16_t durationMs) {
  tone(_pin, frequencyHz, durationMs);
  delay(durationMs);
  noTone(_pin);
}

#ifndef CUE_H
#define CUE_H

#include <stdint.h>

// Alert cue files hold one note per line:
//
//   # siren
//   2500 200
//   0 100        <- rest
//   1800 200
//
// Blank lines and lines starting with '#' are skipped.

struct CueNote {
  uint16_t frequency_hz; // 0 = rest
  uint16_t duration_ms;
};

enum CueLineResult {
  CUE_NOTE = 0,
  CUE_SKIP,
  CUE_INVALID
};

CueLineResult parseCueLine(const char* line, CueNote& note);

#endif // CUE_H

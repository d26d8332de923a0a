#include "cue.h"

#include <ctype.h>
#include <stdlib.h>

static const char* skipSpaces(const char* p) {
  while (*p && isspace((unsigned char)*p)) {
    p++;
  }
  return p;
}

static bool readNumber(const char*& p, uint16_t& out) {
  p = skipSpaces(p);
  if (!isdigit((unsigned char)*p)) {
    return false;
  }
  char* end = nullptr;
  unsigned long value = strtoul(p, &end, 10);
  if (end == p || value > 65535UL) {
    return false;
  }
  out = (uint16_t)value;
  p = end;
  return true;
}

CueLineResult parseCueLine(const char* line, CueNote& note) {
  const char* p = skipSpaces(line);
  if (*p == '\0' || *p == '#') {
    return CUE_SKIP;
  }

  uint16_t frequency = 0;
  uint16_t duration = 0;
  if (!readNumber(p, frequency) || !readNumber(p, duration)) {
    return CUE_INVALID;
  }

  p = skipSpaces(p);
  if (*p != '\0' && *p != '#') {
    return CUE_INVALID;
  }
  if (duration == 0) {
    return CUE_INVALID;
  }

  note.frequency_hz = frequency;
  note.duration_ms = duration;
  return CUE_NOTE;
}

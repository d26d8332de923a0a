#ifndef CLOCK_H
#define CLOCK_H

#include <time.h>

// Wall time before this (2021-01-01T00:00:00Z) means NTP has not synced yet
#define MIN_VALID_EPOCH ((time_t)1609459200)

// Time source for the monitor. The firmware uses millis()/delay() and the
// NTP clock; tests drive a manual clock.
class Clock {
public:
  virtual ~Clock() {}

  // Milliseconds since boot, wraps like millis()
  virtual unsigned long nowMs() = 0;
  virtual void sleepMs(unsigned long ms) = 0;

  // Seconds since epoch (UTC), 0 while wall time is unknown
  virtual time_t epoch() = 0;
};

#endif // CLOCK_H

#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <time.h>

// Log lines look like:
//   2026-10-18 09:12:44 [MEAS] Distance: 4.02 cm | Water Height: 15.98 cm
// or, before the wall clock is known:
//   ms=5231 [MEAS] Distance: 4.02 cm | Water Height: 15.98 cm

enum LogLevel {
  LOG_DEBUG = 0,
  LOG_INFO,
  LOG_WARN,
  LOG_ERROR
};

typedef void (*LogLineSink)(LogLevel level, const char* line);

// Lines are dropped until a sink is installed.
void Log_SetSink(LogLineSink sink);
void Log_SetMinLevel(LogLevel level);

// Optional wall-clock source. Uptime is used when it is not set or
// returns a time before 2021.
void Log_SetTimeProvider(time_t (*nowEpoch)());
void Log_SetUptimeProvider(unsigned long (*uptimeMs)());

void Log_Debug(const char* fmt, ...);
void Log_Info(const char* fmt, ...);
void Log_Warn(const char* fmt, ...);
void Log_Error(const char* fmt, ...);

// Per-cycle sensor readings.
void Log_Measure(const char* fmt, ...);
// Things the monitor did (alerts, audio, cooldown).
void Log_Action(const char* fmt, ...);

#endif // LOG_H

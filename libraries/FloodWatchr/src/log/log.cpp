#include "log.h"

#include <stdarg.h>
#include <stdio.h>
#include "../monitor/clock.h"

static LogLineSink g_sink = nullptr;
static LogLevel g_minLevel = LOG_INFO;
static time_t (*g_nowEpoch)() = nullptr;
static unsigned long (*g_uptimeMs)() = nullptr;

static bool formatEpoch(time_t epoch, char* out, size_t len) {
  struct tm tmv;
  if (!gmtime_r(&epoch, &tmv)) {
    return false;
  }
  int written = snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
                         tmv.tm_year + 1900,
                         tmv.tm_mon + 1,
                         tmv.tm_mday,
                         tmv.tm_hour,
                         tmv.tm_min,
                         tmv.tm_sec);
  return written > 0 && written < (int)len;
}

static void emit(LogLevel level, const char* tag, const char* fmt, va_list ap) {
  if (!g_sink || level < g_minLevel) {
    return;
  }

  char msg[256];
  vsnprintf(msg, sizeof(msg), fmt, ap);

  char ts[32];
  bool haveTs = false;
  if (g_nowEpoch) {
    time_t now = g_nowEpoch();
    if (now >= MIN_VALID_EPOCH) {
      haveTs = formatEpoch(now, ts, sizeof(ts));
    }
  }
  if (!haveTs) {
    unsigned long uptime = g_uptimeMs ? g_uptimeMs() : 0;
    snprintf(ts, sizeof(ts), "ms=%lu", uptime);
  }

  char line[320];
  snprintf(line, sizeof(line), "%s [%s] %s", ts, tag, msg);
  g_sink(level, line);
}

void Log_SetSink(LogLineSink sink) {
  g_sink = sink;
}

void Log_SetMinLevel(LogLevel level) {
  g_minLevel = level;
}

void Log_SetTimeProvider(time_t (*nowEpoch)()) {
  g_nowEpoch = nowEpoch;
}

void Log_SetUptimeProvider(unsigned long (*uptimeMs)()) {
  g_uptimeMs = uptimeMs;
}

void Log_Debug(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_DEBUG, "DBG", fmt, ap);
  va_end(ap);
}

void Log_Info(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_INFO, "INFO", fmt, ap);
  va_end(ap);
}

void Log_Warn(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_WARN, "WARN", fmt, ap);
  va_end(ap);
}

void Log_Error(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_ERROR, "ERR", fmt, ap);
  va_end(ap);
}

void Log_Measure(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_INFO, "MEAS", fmt, ap);
  va_end(ap);
}

void Log_Action(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LOG_INFO, "ACT", fmt, ap);
  va_end(ap);
}

#pragma once

#include <cstdint>

// Tagged printf-style logging: "[tag] message". The writer is swappable so
// the firmware can route lines to Serial and tests can capture them.

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

typedef void (*LogWriter)(LogLevel level, const char* line);

void LogSetWriter(LogWriter writer);   // nullptr restores the stderr writer
void LogSetLevel(LogLevel min_level);
LogLevel LogGetLevel();

void LogPrintf(LogLevel level, const char* tag, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));

const char* LogLevelName(LogLevel level);

#define PD_LOGD(tag, ...) LogPrintf(LogLevel::Debug, tag, __VA_ARGS__)
#define PD_LOGI(tag, ...) LogPrintf(LogLevel::Info,  tag, __VA_ARGS__)
#define PD_LOGW(tag, ...) LogPrintf(LogLevel::Warn,  tag, __VA_ARGS__)
#define PD_LOGE(tag, ...) LogPrintf(LogLevel::Error, tag, __VA_ARGS__)

#include "Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

static constexpr int LINE_MAX_CHARS = 256;

static void stderr_writer(LogLevel level, const char* line) {
  std::fprintf(stderr, "%s %s\n", LogLevelName(level), line);
}

static std::atomic<LogWriter> g_writer{&stderr_writer};
static std::atomic<uint8_t>   g_min_level{(uint8_t)LogLevel::Info};

void LogSetWriter(LogWriter writer) {
  g_writer.store(writer ? writer : &stderr_writer);
}

void LogSetLevel(LogLevel min_level) {
  g_min_level.store((uint8_t)min_level);
}

LogLevel LogGetLevel() {
  return (LogLevel)g_min_level.load();
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "D";
    case LogLevel::Info:  return "I";
    case LogLevel::Warn:  return "W";
    case LogLevel::Error: return "E";
    default:              return "?";
  }
}

void LogPrintf(LogLevel level, const char* tag, const char* fmt, ...) {
  if ((uint8_t)level < g_min_level.load()) return;

  char line[LINE_MAX_CHARS];
  int n = std::snprintf(line, sizeof(line), "[%s] ", tag ? tag : "-");
  if (n < 0) return;
  if (n >= (int)sizeof(line)) n = (int)sizeof(line) - 1;

  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(line + n, sizeof(line) - (size_t)n, fmt, ap);  // truncates long lines
  va_end(ap);

  g_writer.load()(level, line);
}

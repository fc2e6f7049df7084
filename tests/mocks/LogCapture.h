#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "Log.h"

// Routes log lines into memory for the lifetime of the object.
class LogCapture {
public:
  struct Line {
    LogLevel    level;
    std::string text;
  };

  LogCapture() {
    Lines().clear();
    _prevLevel = LogGetLevel();
    LogSetLevel(LogLevel::Debug);
    LogSetWriter(&LogCapture::Write);
  }

  ~LogCapture() {
    LogSetWriter(nullptr);
    LogSetLevel(_prevLevel);
  }

  bool contains(LogLevel level, const std::string& needle) const {
    std::lock_guard<std::mutex> guard(Mutex());
    for (const Line& l : Lines()) {
      if (l.level == level && l.text.find(needle) != std::string::npos) return true;
    }
    return false;
  }

  size_t count(LogLevel level) const {
    std::lock_guard<std::mutex> guard(Mutex());
    size_t n = 0;
    for (const Line& l : Lines()) n += (l.level == level) ? 1 : 0;
    return n;
  }

private:
  static std::vector<Line>& Lines() {
    static std::vector<Line> lines;
    return lines;
  }

  static std::mutex& Mutex() {
    static std::mutex m;
    return m;
  }

  static void Write(LogLevel level, const char* line) {
    std::lock_guard<std::mutex> guard(Mutex());
    Lines().push_back(Line{level, line});
  }

  LogLevel _prevLevel;
};

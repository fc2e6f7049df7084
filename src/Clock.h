#pragma once

#include <cstdint>
#include <string>

class Clock {
public:
  virtual ~Clock() = default;

  // Monotonic seconds; only differences are meaningful.
  virtual uint32_t nowS() const = 0;

  // Local wall time as "%Y-%m-%d %H:%M:%S" for log lines.
  virtual std::string timestamp() const = 0;
};

class SystemClock : public Clock {
public:
  uint32_t nowS() const override;
  std::string timestamp() const override;
};

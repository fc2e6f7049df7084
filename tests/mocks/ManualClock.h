#pragma once

#include <string>

#include "Clock.h"

class ManualClock : public Clock {
public:
  uint32_t nowS() const override { return now; }
  std::string timestamp() const override { return stamp; }

  void advance(uint32_t s) { now += s; }

  uint32_t    now = 1000;
  std::string stamp = "2024-05-01 12:00:00";
};

#pragma once

#include <vector>

#include "DiscoveryBackend.h"

class FakeDiscoveryBackend : public DiscoveryBackend {
public:
  bool available() const override { return isAvailable; }

  bool discover(std::vector<DiscoveryRecord>& out, uint32_t timeout_s) override {
    runs++;
    lastTimeoutS = timeout_s;
    if (failScan) return false;
    out = next;
    return true;
  }

  const char* describe() const override { return "fake-ble"; }

  bool     isAvailable = true;
  bool     failScan = false;
  std::vector<DiscoveryRecord> next;
  int      runs = 0;
  uint32_t lastTimeoutS = 0;
};

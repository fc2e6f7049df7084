#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <NimBLEDevice.h>   // NimBLEScan, NimBLEAdvertisedDevice

#include "DiscoveryBackend.h"

// Active NimBLE scan run to completion (bounded by timeout) per call.
class BleDiscovery : public DiscoveryBackend {
public:
  bool begin();

  bool available() const override { return _bleScan != nullptr; }
  bool discover(std::vector<DiscoveryRecord>& out, uint32_t timeout_s) override;
  const char* describe() const override { return "nimble"; }

private:
  static bool ToRecord(const NimBLEAdvertisedDevice& dev, DiscoveryRecord& out);

  NimBLEScan* _bleScan = nullptr;
};

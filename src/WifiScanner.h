#pragma once

#include <vector>

#include "Device.h"

// Synchronous station-mode scan; one call = one network-scan batch.
class WifiScanner {
public:
  bool begin();
  bool scan(std::vector<NetworkScanRecord>& out);

private:
  bool _ready = false;
};

#pragma once

#include <cstdint>
#include <vector>

#include "Device.h"

// Short-range radio discovery. discover() blocks for up to timeout_s and is
// always called without any registry lock held.
class DiscoveryBackend {
public:
  virtual ~DiscoveryBackend() = default;

  virtual bool available() const = 0;
  virtual bool discover(std::vector<DiscoveryRecord>& out, uint32_t timeout_s) = 0;
  virtual const char* describe() const = 0;
};

class UnavailableDiscoveryBackend : public DiscoveryBackend {
public:
  bool available() const override { return false; }
  bool discover(std::vector<DiscoveryRecord>&, uint32_t) override { return false; }
  const char* describe() const override { return "none"; }
};

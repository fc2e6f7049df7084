#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "Device.h"

// Raw reading as a receiver reports it. mode: 0/1 = no fix, 2 = 2D, 3 = 3D.
struct RawFix {
  int         mode = 0;
  double      lat = 0.0;
  double      lon = 0.0;
  double      alt = 0.0;
  std::string time;
  int         satellites = 0;
};

// Pull-based fix source. fetch() must give up after timeout_ms.
class LocationSource {
public:
  virtual ~LocationSource() = default;

  virtual bool available() const = 0;
  virtual bool fetch(RawFix& out, uint32_t timeout_ms) = 0;
  virtual const char* describe() const = 0;
};

// Stand-in when GPS is disabled or the receiver never came up.
class UnavailableLocationSource : public LocationSource {
public:
  bool available() const override { return false; }
  bool fetch(RawFix&, uint32_t) override { return false; }
  const char* describe() const override { return "none"; }
};

class LocationCorrelator {
public:
  LocationCorrelator(LocationSource& source, uint32_t timeout_ms);

  // Never fails loudly: any problem just means "no fix".
  bool currentFix(LocationFix& out);

  const char* sourceName() const { return _source.describe(); }

  static bool FromRaw(const RawFix& raw, LocationFix& out);

private:
  LocationSource&   _source;
  uint32_t          _timeoutMs;
  std::atomic<bool> _warnedUnavailable{false};
  std::atomic<bool> _announcedBack{false};
};

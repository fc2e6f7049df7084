#pragma once

#include <cstdint>
#include <string>

#include "CaptureTracker.h"
#include "IngestionPipeline.h"

// Turns newly finished .pcap files in capture_dir into capture-complete
// events. Files present when begin() runs are never reported.
class CaptureWatcher {
public:
  void begin(IngestionPipeline* pipeline, const std::string& dir);
  void poll();   // cheap when not due

private:
  static constexpr uint32_t POLL_MS = 5000;

  bool listCaptures(CaptureTracker::Listing& out);

  IngestionPipeline* _pipeline = nullptr;
  std::string        _dir;
  CaptureTracker     _tracker;
  uint32_t           _lastPollMs = 0;
};

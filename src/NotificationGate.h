#pragma once

#include <atomic>
#include <cstdint>

class NotificationGate {
public:
  // anyNewThisBatch is the OR of every upsert() result in one batch.
  static bool ShouldNotify(bool anyNewThisBatch, bool notifyEnabled) {
    return anyNewThisBatch && notifyEnabled;
  }
};

// One-shot flag between the ingestion path (raise) and the display task
// (consume). Several raises before a consume collapse into one pulse.
class PendingSignal {
public:
  void raise();
  bool consume();
  bool pending() const { return _pending.load(); }

private:
  std::atomic<bool> _pending{false};
};

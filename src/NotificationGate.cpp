#include "NotificationGate.h"

void PendingSignal::raise() {
  _pending.store(true);
}

bool PendingSignal::consume() {
  return _pending.exchange(false);
}

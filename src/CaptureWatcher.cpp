#include "CaptureWatcher.h"

#include <Arduino.h>
#include <SD.h>

#include "Log.h"

static constexpr const char* TAG = "capture";

void CaptureWatcher::begin(IngestionPipeline* pipeline, const std::string& dir) {
  _pipeline = pipeline;
  _dir = dir;

  CaptureTracker::Listing existing;
  if (!listCaptures(existing)) PD_LOGW(TAG, "%s not readable yet", _dir.c_str());
  _tracker.prime(existing);

  _lastPollMs = millis();
  PD_LOGI(TAG, "watching %s (%u existing captures ignored)", _dir.c_str(), (unsigned)_tracker.tracked());
}

bool CaptureWatcher::listCaptures(CaptureTracker::Listing& out) {
  File root = SD.open(_dir.c_str());
  if (!root || !root.isDirectory()) return false;

  File f = root.openNextFile();
  while (f) {
    if (!f.isDirectory()) {
      std::string path = _dir + "/" + f.name();
      // older cores report the full path from name()
      if (f.name()[0] == '/') path = f.name();
      if (CaptureTracker::IsCapture(path)) out.insert(path);
    }
    f.close();
    f = root.openNextFile();
  }
  root.close();
  return true;
}

void CaptureWatcher::poll() {
  if (!_pipeline) return;

  const uint32_t ms = millis();
  if (ms - _lastPollMs < POLL_MS) return;
  _lastPollMs = ms;

  // an unreadable directory is not an empty one
  CaptureTracker::Listing now;
  if (!listCaptures(now)) return;

  for (const std::string& path : _tracker.update(now)) {
    CaptureEvent ev;
    ev.artifact_path = path;
    _pipeline->onCaptureComplete(ev);
  }
}

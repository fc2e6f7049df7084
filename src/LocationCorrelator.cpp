#include "LocationCorrelator.h"

#include <cmath>

#include "Log.h"

static constexpr const char* TAG = "gps";

static constexpr int MODE_2D = 2;
static constexpr int MODE_3D = 3;

LocationCorrelator::LocationCorrelator(LocationSource& source, uint32_t timeout_ms)
  : _source(source), _timeoutMs(timeout_ms) {}

bool LocationCorrelator::FromRaw(const RawFix& raw, LocationFix& out) {
  if (raw.mode < MODE_2D) return false;
  if (!std::isfinite(raw.lat) || !std::isfinite(raw.lon)) return false;

  LocationFix f;
  f.latitude = raw.lat;
  f.longitude = raw.lon;
  f.altitude = (raw.mode == MODE_3D && std::isfinite(raw.alt)) ? raw.alt : 0.0;
  f.fix_time = raw.time;
  f.satellites = raw.satellites;
  out = f;
  return true;
}

bool LocationCorrelator::currentFix(LocationFix& out) {
  if (!_source.available()) {
    if (!_warnedUnavailable.exchange(true)) {
      PD_LOGW(TAG, "location source '%s' unavailable, detections will carry no fix", _source.describe());
    }
    return false;
  }

  // Undo a boot-time warning once the source turns up
  if (_warnedUnavailable.load() && !_announcedBack.exchange(true)) {
    PD_LOGI(TAG, "location source '%s' is now available", _source.describe());
  }

  RawFix raw;
  if (!_source.fetch(raw, _timeoutMs)) {
    PD_LOGW(TAG, "fix fetch from '%s' failed or timed out (%u ms)", _source.describe(), (unsigned)_timeoutMs);
    return false;
  }

  if (!FromRaw(raw, out)) {
    PD_LOGD(TAG, "no usable fix (mode=%d sats=%d)", raw.mode, raw.satellites);
    return false;
  }
  return true;
}

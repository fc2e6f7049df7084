#include "IngestionPipeline.h"

#include <cstdio>

#include "Log.h"
#include "SnapshotJson.h"

static constexpr const char* TAG = "pipeline";

namespace
{
  // Fetches the fix on first use so a batch with no matches costs no GPS
  // round trip, and a batch with many matches costs exactly one.
  class BatchFix
  {
  public:
    explicit BatchFix(LocationCorrelator& c) : _correlator(c) {}

    const LocationFix* get()
    {
      if (!_fetched) {
        _fetched = true;
        _valid = _correlator.currentFix(_fix);
      }
      return _valid ? &_fix : nullptr;
    }

  private:
    LocationCorrelator& _correlator;
    LocationFix _fix;
    bool _fetched = false;
    bool _valid = false;
  };
}

static std::string HeaderFor(size_t pwn, size_t flippers) {
  char header[48];
  std::snprintf(header, sizeof(header), "Pwn: %u | Flip: %u", (unsigned)pwn, (unsigned)flippers);
  return header;
}

IngestionPipeline::IngestionPipeline(const DetectorConfig& cfg,
                                     Clock& clock,
                                     LocationSource& location,
                                     DiscoveryBackend& discovery,
                                     Storage& storage)
  : _cfg(cfg),
    _clock(clock),
    _location(location, cfg.gps_timeout_ms),
    _discovery(discovery),
    _storage(storage),
    _header(HeaderFor(0, 0)),
    _notify(cfg.notify) {}

bool IngestionPipeline::begin() {
  if (!_classifier.setPatterns(_cfg.pwn_pattern, _cfg.flipper_wifi_pattern, _cfg.flipper_bt_pattern)) {
    PD_LOGE(TAG, "classifier patterns rejected, ingestion disabled");
    return false;
  }

  _logPath = _cfg.log_file;
  if (!_logPath.empty()) {
    const size_t slash = _logPath.find_last_of('/');
    const std::string dir = (slash == std::string::npos || slash == 0) ? std::string{} : _logPath.substr(0, slash);
    if (!dir.empty() && !_storage.exists(dir) && !_storage.makeDirs(dir)) {
      PD_LOGE(TAG, "cannot create log directory %s, file logging disabled", dir.c_str());
      _logPath.clear();
    }
  }

  PD_LOGI(TAG, "ready: wifi=%d ble=%d (%s) gps=%s log=%s interval=%us",
          (int)_cfg.wifi_enabled, (int)_cfg.bluetooth_enabled, _discovery.describe(),
          _location.sourceName(), _logPath.empty() ? "(off)" : _logPath.c_str(),
          (unsigned)_cfg.scan_interval_s);
  return true;
}

// ----------------------------- Network scan -----------------------------

ScanOutcome IngestionPipeline::onNetworkScan(const std::vector<NetworkScanRecord>& batch, BatchStats* stats) {
  if (!_classifier.ready()) return ScanOutcome::NotReady;

  const uint32_t now = _clock.nowS();
  {
    std::lock_guard<std::mutex> guard(_stateLock);
    if (_haveAccepted && (now - _lastAcceptedS) < _cfg.scan_interval_s) {
      return ScanOutcome::RateLimited;
    }
    _haveAccepted = true;
    _lastAcceptedS = now;
  }

  BatchStats st;
  st.received = batch.size();

  if (_cfg.wifi_enabled) {
    BatchFix fix(_location);

    for (const NetworkScanRecord& rec : batch) {
      std::string addr;
      if (rec.hostname.empty() || !NormalizeAddress(rec.mac, addr)) {
        st.malformed++;
        continue;
      }

      DeviceCategory cat;
      if (!_classifier.classifyNetwork(rec.hostname, cat)) {
        st.unmatched++;
        continue;
      }

      const std::string name = TruncateName(rec.hostname, _cfg.name_width);
      const bool is_new = _registry.upsert(addr, name, cat, rec.rssi, now, fix.get());
      st.upserted++;
      if (is_new) {
        st.added++;
        PD_LOGI(TAG, "new %s %s (%s) rssi=%d", CategoryName(cat), name.c_str(), addr.c_str(), rec.rssi);
      }
    }

    finishBatch("wifi", now, st);
  }

  if (_registry.evict(now) > 0) refreshProjection(_registry.snapshot(), now);

  if (stats) *stats = st;

  if (_cfg.bluetooth_enabled) runDiscovery();

  return ScanOutcome::Accepted;
}

// ----------------------------- Discovery -----------------------------

bool IngestionPipeline::runDiscovery(BatchStats* stats) {
  if (!_classifier.ready() || !_cfg.bluetooth_enabled) return false;

  if (!_discovery.available()) {
    if (!_discoveryWarned.exchange(true)) {
      PD_LOGW(TAG, "discovery backend '%s' unavailable, skipping short-range channel", _discovery.describe());
    }
    return false;
  }

  std::vector<DiscoveryRecord> found;
  if (!_discovery.discover(found, _cfg.discovery_timeout_s)) {
    PD_LOGW(TAG, "discovery via '%s' failed", _discovery.describe());
    return false;
  }

  return onDiscoveryBatch(found, stats);
}

bool IngestionPipeline::onDiscoveryBatch(const std::vector<DiscoveryRecord>& batch, BatchStats* stats) {
  if (!_classifier.ready()) return false;

  const uint32_t now = _clock.nowS();
  BatchStats st;
  st.received = batch.size();

  BatchFix fix(_location);

  for (const DiscoveryRecord& rec : batch) {
    std::string addr;
    if (rec.name.empty() || !NormalizeAddress(rec.address, addr)) {
      st.malformed++;
      continue;
    }

    DeviceCategory cat;
    if (!_classifier.classifyDiscovery(rec.name, cat)) {
      st.unmatched++;
      continue;
    }

    const std::string name = TruncateName(rec.name, _cfg.name_width);
    const bool is_new = _registry.upsert(addr, name, cat, rec.rssi, now, fix.get());
    st.upserted++;
    if (is_new) {
      st.added++;
      PD_LOGI(TAG, "new %s %s (%s)", CategoryName(cat), name.c_str(), addr.c_str());
    }
  }

  finishBatch("ble", now, st);

  if (stats) *stats = st;
  return st.added > 0;
}

// ----------------------------- Batch tail -----------------------------

void IngestionPipeline::finishBatch(const char* channel, uint32_t now_s, BatchStats& st) {
  // every upsert of this batch is committed before anything below looks
  st.notified = NotificationGate::ShouldNotify(st.added > 0, notifyEnabled());
  if (st.notified) _flash.raise();

  const RegistrySnapshot snap = _registry.snapshot();
  refreshProjection(snap, now_s);
  st.logged = appendLog(snap);

  PD_LOGD(TAG, "%s batch: %u recv, %u bad, %u unmatched, %u upserted, %u new",
          channel, (unsigned)st.received, (unsigned)st.malformed, (unsigned)st.unmatched,
          (unsigned)st.upserted, (unsigned)st.added);
}

void IngestionPipeline::refreshProjection(const RegistrySnapshot& snap, uint32_t now_s) {
  std::vector<std::string> names;
  names.reserve(snap.pwn.size() + snap.flippers.size());
  for (const DeviceRecord& r : snap.pwn) names.push_back(r.name);
  for (const DeviceRecord& r : snap.flippers) names.push_back(r.name);

  std::lock_guard<std::mutex> guard(_stateLock);
  _header = HeaderFor(snap.pwn.size(), snap.flippers.size());
  _names.swap(names);
  _rotation = RotationProjector::Advance(_rotation, _cfg.rotation_window, _names.size(),
                                         now_s, _cfg.rotation_interval_s);
}

bool IngestionPipeline::appendLog(const RegistrySnapshot& snap) {
  if (_logPath.empty()) return false;

  const std::string line = BuildDetectionLine(snap, _clock.timestamp());
  if (!_storage.append(_logPath, line)) {
    PD_LOGE(TAG, "failed to append detections to %s", _logPath.c_str());
    return false;
  }
  return true;
}

// ----------------------------- Other entry points -----------------------------

std::string IngestionPipeline::SidecarPath(const std::string& artifact, const std::string& extension) {
  const size_t slash = artifact.find_last_of('/');
  const size_t base = (slash == std::string::npos) ? 0 : slash + 1;
  const size_t dot = artifact.find_last_of('.');

  // a leading dot names a hidden file, not an extension
  if (dot != std::string::npos && dot > base) return artifact.substr(0, dot) + extension;
  return artifact + extension;
}

bool IngestionPipeline::onCaptureComplete(const CaptureEvent& ev) {
  if (ev.artifact_path.empty()) {
    PD_LOGW(TAG, "capture event without a path");
    return false;
  }

  LocationFix fix;
  if (!_location.currentFix(fix)) {
    PD_LOGI(TAG, "no GPS fix, no sidecar for %s", ev.artifact_path.c_str());
    return false;
  }

  const std::string path = SidecarPath(ev.artifact_path, _cfg.sidecar_extension);
  if (!_storage.write(path, BuildFixDocument(fix))) {
    PD_LOGE(TAG, "failed to write %s", path.c_str());
    return false;
  }

  PD_LOGI(TAG, "saved fix %.6f,%.6f to %s", fix.latitude, fix.longitude, path.c_str());
  return true;
}

std::string IngestionPipeline::query() {
  const RegistrySnapshot snap = _registry.snapshot();

  LocationFix fix;
  const bool has_fix = _location.currentFix(fix);

  return BuildQueryResponse(snap, _clock.timestamp(), has_fix ? &fix : nullptr);
}

std::vector<std::string> IngestionPipeline::displayLines() {
  const uint32_t now = _clock.nowS();

  std::lock_guard<std::mutex> guard(_stateLock);
  _rotation = RotationProjector::Advance(_rotation, _cfg.rotation_window, _names.size(),
                                         now, _cfg.rotation_interval_s);
  return RotationProjector::Project(_header, _names, _cfg.rotation_window, _rotation.cursor);
}

void IngestionPipeline::evictNow() {
  const uint32_t now = _clock.nowS();
  if (_registry.evict(now) > 0) refreshProjection(_registry.snapshot(), now);
}

void IngestionPipeline::reset() {
  _registry.reset();

  {
    std::lock_guard<std::mutex> guard(_stateLock);
    _rotation = RotationState{};
    _header = HeaderFor(0, 0);
    _names.clear();
  }
  PD_LOGI(TAG, "registry cleared");
}

void IngestionPipeline::setNotify(bool on) {
  std::lock_guard<std::mutex> guard(_stateLock);
  _notify = on;
}

bool IngestionPipeline::notifyEnabled() const {
  std::lock_guard<std::mutex> guard(_stateLock);
  return _notify;
}

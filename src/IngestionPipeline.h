#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "Clock.h"
#include "Config.h"
#include "DeviceRegistry.h"
#include "DiscoveryBackend.h"
#include "LocationCorrelator.h"
#include "NotificationGate.h"
#include "PatternClassifier.h"
#include "RotationProjector.h"
#include "Storage.h"

enum class ScanOutcome : uint8_t {
  Accepted = 0,
  RateLimited,
  NotReady,     // begin() failed or was never called
};

// What one batch did; mostly for logs and tests.
struct BatchStats {
  size_t received = 0;
  size_t malformed = 0;
  size_t unmatched = 0;
  size_t upserted = 0;
  size_t added = 0;
  bool   notified = false;
  bool   logged = false;
};

// Owns the registry and everything that feeds it. Each entry point may be
// called from a different task; the only locks taken are the registry's and
// a short one around rate-limit/rotation state, never across I/O.
class IngestionPipeline {
public:
  IngestionPipeline(const DetectorConfig& cfg,
                    Clock& clock,
                    LocationSource& location,
                    DiscoveryBackend& discovery,
                    Storage& storage);

  // Compiles patterns and prepares the log directory. False = classifier
  // could not be built; ingestion then drops every batch.
  bool begin();

  // Full network-scan cycle: rate limit, ingest, notify, project, log, evict,
  // then one discovery run when that channel is usable.
  ScanOutcome onNetworkScan(const std::vector<NetworkScanRecord>& batch, BatchStats* stats = nullptr);

  // Runs the discovery backend (outside any lock) and merges what it found.
  bool runDiscovery(BatchStats* stats = nullptr);

  // Merge step for an already collected discovery batch. Returns any-new.
  bool onDiscoveryBatch(const std::vector<DiscoveryRecord>& batch, BatchStats* stats = nullptr);

  // Writes a location sidecar next to the artifact when a fix exists.
  bool onCaptureComplete(const CaptureEvent& ev);

  // Snapshot plus current fix as JSON.
  std::string query();

  // Header + rotated names from the last projection; advances rotation
  // when due. Does not touch the registry.
  std::vector<std::string> displayLines();

  void evictNow();
  void reset();

  void setNotify(bool on);
  bool notifyEnabled() const;

  PendingSignal&        flashSignal()    { return _flash; }
  DeviceRegistry&       registry()       { return _registry; }
  const DetectorConfig& config() const   { return _cfg; }
  bool                  loggingEnabled() const { return !_logPath.empty(); }

  static std::string SidecarPath(const std::string& artifact, const std::string& extension);

private:
  void finishBatch(const char* channel, uint32_t now_s, BatchStats& st);

  // Rebuilds the cached header and name list, then advances rotation.
  void refreshProjection(const RegistrySnapshot& snap, uint32_t now_s);
  bool appendLog(const RegistrySnapshot& snap);

  DetectorConfig    _cfg;
  Clock&            _clock;
  LocationCorrelator _location;
  DiscoveryBackend& _discovery;
  Storage&          _storage;

  PatternClassifier _classifier;
  DeviceRegistry    _registry;
  PendingSignal     _flash;

  std::string       _logPath;

  // guarded by _stateLock
  mutable std::mutex _stateLock;
  bool              _haveAccepted = false;
  uint32_t          _lastAcceptedS = 0;
  RotationState     _rotation;
  std::string       _header;
  std::vector<std::string> _names;   // pwn first, then flippers
  bool              _notify = true;

  std::atomic<bool> _discoveryWarned{false};
};

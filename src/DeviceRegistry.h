#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "Device.h"

// Address-keyed store of currently present devices, one mapping per group.
// Every public call takes the same lock for its whole in-memory body and
// nothing else; callers do their I/O outside.
class DeviceRegistry {
public:
  static constexpr uint32_t TTL_S = 300;

  // Returns true when the address was not present (a new device).
  // fix may be nullptr; the record's fix is overwritten either way.
  bool upsert(const std::string& address,
              const std::string& name,
              DeviceCategory category,
              int rssi,
              uint32_t now_s,
              const LocationFix* fix);

  // Drops every record with now_s - last_seen_s >= TTL_S, then prunes the
  // known-address index to the surviving keys. Returns how many were dropped.
  size_t evict(uint32_t now_s);

  // Value copy, each group ordered by discovery index.
  RegistrySnapshot snapshot() const;

  void counts(size_t& pwn, size_t& flippers) const;

  bool   isKnown(const std::string& address) const;
  size_t knownCount() const;

  void reset();

private:
  typedef std::unordered_map<std::string, DeviceRecord> RecordMap;

  RecordMap& mapFor(DeviceGroup g) { return g == DeviceGroup::Pwn ? _pwn : _flippers; }

  static void refresh(DeviceRecord& r, const std::string& name, int rssi, uint32_t now_s, const LocationFix* fix);
  static size_t sweep(RecordMap& m, uint32_t now_s);

  mutable std::mutex _lock;

  RecordMap _pwn;
  RecordMap _flippers;
  std::unordered_set<std::string> _known;

  uint32_t _nextIndex = 1;
};

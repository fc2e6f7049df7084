#include "DeviceRegistry.h"

#include <algorithm>
#include <vector>

#include "Log.h"

static constexpr const char* TAG = "registry";

constexpr uint32_t DeviceRegistry::TTL_S;

static std::vector<DeviceRecord> ordered_copy(const std::unordered_map<std::string, DeviceRecord>& m) {
  std::vector<DeviceRecord> out;
  out.reserve(m.size());
  for (const auto& kv : m) out.push_back(kv.second);

  std::sort(out.begin(), out.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
    return a.index < b.index;
  });
  return out;
}

void DeviceRegistry::refresh(DeviceRecord& r, const std::string& name, int rssi, uint32_t now_s, const LocationFix* fix) {
  r.name = name;
  r.rssi = rssi;
  if (now_s > r.last_seen_s) r.last_seen_s = now_s;   // never moves backwards

  r.has_fix = (fix != nullptr);
  r.fix = fix ? *fix : LocationFix{};
}

bool DeviceRegistry::upsert(const std::string& address,
                            const std::string& name,
                            DeviceCategory category,
                            int rssi,
                            uint32_t now_s,
                            const LocationFix* fix) {
  const DeviceGroup group = GroupOf(category);

  std::lock_guard<std::mutex> guard(_lock);

  RecordMap& m = mapFor(group);
  auto it = m.find(address);
  if (it != m.end()) {
    refresh(it->second, name, rssi, now_s, fix);
    return false;
  }

  // Already tracked under the other group: first category wins until eviction.
  if (_known.count(address)) {
    const DeviceGroup other = (group == DeviceGroup::Pwn) ? DeviceGroup::Flipper : DeviceGroup::Pwn;
    RecordMap& om = mapFor(other);
    auto oit = om.find(address);
    if (oit != om.end()) {
      refresh(oit->second, name, rssi, now_s, fix);
      return false;
    }
  }

  DeviceRecord r;
  r.address = address;
  r.category = category;
  r.index = _nextIndex++;
  r.first_seen_s = now_s;
  r.last_seen_s = now_s;
  refresh(r, name, rssi, now_s, fix);

  m.emplace(address, std::move(r));
  _known.insert(address);
  return true;
}

size_t DeviceRegistry::sweep(RecordMap& m, uint32_t now_s) {
  size_t dropped = 0;
  for (auto it = m.begin(); it != m.end(); ) {
    const uint32_t last = it->second.last_seen_s;
    const uint32_t idle = (now_s > last) ? (now_s - last) : 0;
    if (idle >= TTL_S) {
      it = m.erase(it);
      dropped++;
    } else {
      ++it;
    }
  }
  return dropped;
}

size_t DeviceRegistry::evict(uint32_t now_s) {
  size_t dropped = 0, pwn_left = 0, flip_left = 0;
  {
    std::lock_guard<std::mutex> guard(_lock);

    dropped = sweep(_pwn, now_s) + sweep(_flippers, now_s);

    for (auto it = _known.begin(); it != _known.end(); ) {
      if (_pwn.count(*it) || _flippers.count(*it)) ++it;
      else it = _known.erase(it);
    }

    pwn_left = _pwn.size();
    flip_left = _flippers.size();
  }

  if (dropped) {
    PD_LOGI(TAG, "evicted %u stale, %u pwn / %u flipper remain",
            (unsigned)dropped, (unsigned)pwn_left, (unsigned)flip_left);
  }
  return dropped;
}

RegistrySnapshot DeviceRegistry::snapshot() const {
  std::lock_guard<std::mutex> guard(_lock);

  RegistrySnapshot s;
  s.pwn = ordered_copy(_pwn);
  s.flippers = ordered_copy(_flippers);
  return s;
}

void DeviceRegistry::counts(size_t& pwn, size_t& flippers) const {
  std::lock_guard<std::mutex> guard(_lock);
  pwn = _pwn.size();
  flippers = _flippers.size();
}

bool DeviceRegistry::isKnown(const std::string& address) const {
  std::lock_guard<std::mutex> guard(_lock);
  return _known.count(address) != 0;
}

size_t DeviceRegistry::knownCount() const {
  std::lock_guard<std::mutex> guard(_lock);
  return _known.size();
}

void DeviceRegistry::reset() {
  std::lock_guard<std::mutex> guard(_lock);
  _pwn.clear();
  _flippers.clear();
  _known.clear();
  _nextIndex = 1;
}

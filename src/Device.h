#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class DeviceCategory : uint8_t {
  PwnDevice = 1,
  FlipperWifi,
  FlipperBluetooth,
};

// Registry mapping a category is stored under. Both Flipper channels share one.
enum class DeviceGroup : uint8_t { Pwn = 0, Flipper = 1 };

struct LocationFix {
  double      latitude   = 0.0;
  double      longitude  = 0.0;
  double      altitude   = 0.0;   // meters, 0 unless the fix is 3D
  std::string fix_time;           // as reported by the receiver
  int         satellites = 0;
};

struct DeviceRecord {
  std::string    address;         // canonical aa:bb:cc:dd:ee:ff
  std::string    name;            // display name, already truncated
  DeviceCategory category = DeviceCategory::PwnDevice;
  int            rssi = 0;        // dBm
  uint32_t       index = 0;       // discovery order
  uint32_t       first_seen_s = 0;
  uint32_t       last_seen_s  = 0;

  // Where WE were when this device was last seen
  bool           has_fix = false;
  LocationFix    fix;
};

struct RegistrySnapshot {
  std::vector<DeviceRecord> pwn;
  std::vector<DeviceRecord> flippers;
};

// ---- ingestion inputs ----

struct NetworkScanRecord {
  std::string hostname;
  std::string mac;
  int         rssi = 0;
};

struct DiscoveryRecord {
  std::string address;
  std::string name;
  int         rssi = 0;
};

struct CaptureEvent {
  std::string artifact_path;
};

DeviceGroup GroupOf(DeviceCategory c);

// "Pwnagotchi", "WiFi", "Bluetooth"
const char* CategoryName(DeviceCategory c);

// Accepts 6 hex pairs separated by ':' or '-'; writes lowercase ':' form.
bool NormalizeAddress(const std::string& in, std::string& out);

// Cuts to at most max_chars bytes without splitting a UTF-8 sequence.
std::string TruncateName(const std::string& name, size_t max_chars);

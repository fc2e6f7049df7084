#include "BleDiscovery.h"

#include "Log.h"

static constexpr const char* TAG = "ble";

bool BleDiscovery::begin() {
  NimBLEDevice::init("");
  NimBLEDevice::setPower(ESP_PWR_LVL_P9);

  _bleScan = NimBLEDevice::getScan();
  if (!_bleScan) {
    PD_LOGE(TAG, "NimBLE scan object unavailable");
    return false;
  }

  _bleScan->setActiveScan(true);   // names often arrive in the scan response
  _bleScan->setInterval(45);
  _bleScan->setWindow(15);
  _bleScan->setDuplicateFilter(true);

  PD_LOGI(TAG, "BLE discovery ready");
  return true;
}

bool BleDiscovery::ToRecord(const NimBLEAdvertisedDevice& dev, DiscoveryRecord& out) {
  if (!dev.haveName()) return false;

  out.address = dev.getAddress().toString();
  out.name = dev.getName();
  out.rssi = dev.getRSSI();
  return !out.address.empty() && !out.name.empty();
}

bool BleDiscovery::discover(std::vector<DiscoveryRecord>& out, uint32_t timeout_s) {
  if (!_bleScan) return false;
  if (_bleScan->isScanning()) {
    PD_LOGW(TAG, "scan already running");
    return false;
  }

  // Blocking; returns after timeout_s
  NimBLEScanResults results = _bleScan->start(timeout_s, false);

  const int n = results.getCount();
  out.clear();
  out.reserve((size_t)n);
  for (int i = 0; i < n; i++) {
    NimBLEAdvertisedDevice dev = results.getDevice((uint32_t)i);
    DiscoveryRecord rec;
    if (ToRecord(dev, rec)) out.push_back(rec);
  }

  _bleScan->clearResults();

  PD_LOGD(TAG, "scan done, %d seen, %u named", n, (unsigned)out.size());
  return true;
}

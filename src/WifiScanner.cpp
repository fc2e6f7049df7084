#include "WifiScanner.h"

#include <WiFi.h>

#include "Log.h"

static constexpr const char* TAG = "wifi";

bool WifiScanner::begin() {
  // AP+STA so the query surface can stay up while we scan
  if (WiFi.getMode() != WIFI_AP_STA && !WiFi.mode(WIFI_AP_STA)) {
    PD_LOGE(TAG, "failed to enter AP+STA mode");
    return false;
  }
  _ready = true;
  return true;
}

bool WifiScanner::scan(std::vector<NetworkScanRecord>& out) {
  out.clear();
  if (!_ready) return false;

  const int n = WiFi.scanNetworks(false /*async*/, true /*show_hidden*/);
  if (n < 0) {
    // -1 running, -2 failed
    PD_LOGW(TAG, "scanNetworks returned %d", n);
    WiFi.scanDelete();
    return false;
  }

  out.reserve((size_t)n);
  for (int i = 0; i < n; i++) {
    NetworkScanRecord rec;
    rec.hostname = WiFi.SSID(i).c_str();
    rec.mac = WiFi.BSSIDstr(i).c_str();
    rec.rssi = WiFi.RSSI(i);
    out.push_back(rec);
  }

  WiFi.scanDelete(); // free memory

  PD_LOGD(TAG, "scan done, n=%d", n);
  return true;
}

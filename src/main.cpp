#include <M5Cardputer.h>

#include <algorithm>
#include <vector>

#include "Clock.h"
#include "Config.h"
#include "Log.h"
#include "IngestionPipeline.h"
#include "GNSSModule.h"
#include "BleDiscovery.h"
#include "WifiScanner.h"
#include "SdStorage.h"
#include "CaptureWatcher.h"
#include "QueryServer.h"
#include "StatusDisplay.h"

#define VERSION "1.0.00"

static const char* CONFIG_PATH = "/pwndetector.json";

static const uint32_t UI_FRAME_MS = 33;
static const uint32_t MIN_SCAN_PERIOD_MS = 5000;

// Cardputer microSD wiring
static constexpr int SD_SCK  = 40;
static constexpr int SD_MISO = 39;
static constexpr int SD_MOSI = 14;
static constexpr int SD_CS   = 12;

static DetectorConfig g_cfg;
static SystemClock    g_clock;
static SdStorage      g_storage;
static GNSSModule     g_gnss;
static BleDiscovery   g_ble;
static WifiScanner    g_wifi;
static UnavailableLocationSource   g_noGps;
static UnavailableDiscoveryBackend g_noBle;

static IngestionPipeline* g_pipeline = nullptr;
static StatusDisplay  g_ui(VERSION);
static CaptureWatcher g_captures;
static QueryServer    g_web;

static void serial_writer(LogLevel level, const char* line) {
  Serial.printf("%s %s\n", LogLevelName(level), line);
}

// Wi-Fi scan, discovery run and eviction, all on one task so a slow BLE scan
// only ever delays the next Wi-Fi scan, never the UI.
static void scan_task(void*) {
  const uint32_t period_ms = std::max<uint32_t>(MIN_SCAN_PERIOD_MS, g_cfg.scan_interval_s * 1000);
  std::vector<NetworkScanRecord> batch;

  while (true) {
    if (g_cfg.wifi_enabled && !g_wifi.scan(batch)) batch.clear();

    const ScanOutcome r = g_pipeline->onNetworkScan(batch);
    if (r == ScanOutcome::NotReady) {
      vTaskDelete(nullptr);
      return;
    }

    vTaskDelay(pdMS_TO_TICKS(period_ms));
  }
}

static void load_config() {
  std::string text;
  if (!g_storage.readAll(CONFIG_PATH, text)) {
    PD_LOGI("main", "%s not found, using defaults", CONFIG_PATH);
    return;
  }
  if (!LoadConfigJson(text, g_cfg)) {
    PD_LOGE("main", "%s unreadable, using defaults", CONFIG_PATH);
    g_cfg = DetectorConfig{};
  }
}

void setup() {
  Serial.begin(115200);
  LogSetWriter(&serial_writer);

  auto cfg = M5.config();
  cfg.serial_baudrate = 115200;
  cfg.fallback_board  = m5::board_t::board_M5Cardputer;
  M5Cardputer.begin(cfg, true);
  M5Cardputer.Keyboard.begin();

  M5.Display.setRotation(1);
  M5.Display.setBrightness(128);

  if (g_storage.begin(SD_SCK, SD_MISO, SD_MOSI, SD_CS)) load_config();

  // Backends are resolved once here; the pipeline only sees the interfaces
  LocationSource* location = &g_noGps;
  if (g_cfg.gps_enabled) {
    g_gnss.begin(g_cfg.gps_baud, g_cfg.gps_rx, g_cfg.gps_tx);
    location = &g_gnss;
  }

  // Wi-Fi first: NimBLE and the Wi-Fi driver share the radio coexistence setup
  const bool wifi_ok = g_wifi.begin();
  if (!wifi_ok) g_cfg.wifi_enabled = false;

  DiscoveryBackend* discovery = &g_noBle;
  if (g_cfg.bluetooth_enabled && g_ble.begin()) discovery = &g_ble;

  g_pipeline = new IngestionPipeline(g_cfg, g_clock, *location, *discovery, g_storage);
  if (!g_pipeline->begin()) {
    PD_LOGE("main", "pipeline failed to start, display only");
  }

  const bool web_ok = g_cfg.web_enabled && wifi_ok &&
                      g_web.begin(g_pipeline, g_cfg.ap_ssid, g_cfg.ap_password);
  if (g_storage.mounted()) g_captures.begin(g_pipeline, g_cfg.capture_dir);

  g_ui.begin(g_pipeline);

  xTaskCreatePinnedToCore(scan_task, "pd_scan", 8192, nullptr, 5, nullptr, 0);

  PD_LOGI("main", "web=%s heap free=%u min=%u",
          web_ok ? "on" : "off",
          (unsigned)esp_get_free_heap_size(),
          (unsigned)esp_get_minimum_free_heap_size());
}

void loop() {
  M5Cardputer.update();

  if (M5Cardputer.Keyboard.isChange() && M5Cardputer.Keyboard.isPressed())
    g_ui.handleKeyboard(M5Cardputer.Keyboard);

  g_captures.poll();

  static uint32_t last_ms = 0;
  const uint32_t ms = millis();
  if (ms - last_ms >= UI_FRAME_MS) {
    last_ms = ms;
    g_ui.update();
  }

  delay(1);
}

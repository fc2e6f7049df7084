#pragma once

#include <cstdint>
#include <string>

enum class FontSize : uint8_t { Small = 0, Medium, Bold };

struct DetectorConfig {
  // Channels
  bool        wifi_enabled      = true;
  bool        bluetooth_enabled = true;

  // Classifier
  std::string pwn_pattern          = "pwnagotchi";
  std::string flipper_wifi_pattern = "flipper";
  std::string flipper_bt_pattern   = "Flipper";

  // Ingestion
  uint32_t    scan_interval_s     = 60;
  uint32_t    discovery_timeout_s = 5;
  uint32_t    name_width          = 20;

  // Rotation
  uint32_t    rotation_window     = 3;
  uint32_t    rotation_interval_s = 10;

  // Outputs
  std::string log_file          = "/pwndetector/detections.json";   // "" disables
  bool        notify            = true;
  std::string sidecar_extension = ".gps.json";
  std::string capture_dir       = "/handshakes";

  // GNSS receiver (UART)
  bool        gps_enabled    = true;
  uint32_t    gps_baud       = 115200;
  int         gps_rx         = 15;
  int         gps_tx         = 13;
  uint32_t    gps_timeout_ms = 2000;

  // Display
  int         ui_x      = 0;
  int         ui_y      = 0;
  FontSize    font_size = FontSize::Small;

  // Query surface
  bool        web_enabled = true;
  std::string ap_ssid     = "pwndetector";
  std::string ap_password;                 // empty = open AP
};

// Overlays keys from a JSON object onto cfg. Unknown keys are ignored; a key
// with a bad value is logged and leaves the current value in place.
// Returns false only when the text is not a JSON object at all.
bool LoadConfigJson(const std::string& text, DetectorConfig& cfg);

const char* FontSizeName(FontSize f);
bool ParseFontSize(const char* s, FontSize& out);

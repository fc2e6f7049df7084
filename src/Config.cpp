#include "Config.h"

#include <ArduinoJson.h>

#include <cctype>

#include "Log.h"
#include "PatternClassifier.h"

static constexpr const char* TAG = "config";

static constexpr uint32_t NAME_WIDTH_MAX        = 64;
static constexpr uint32_t DISCOVERY_TIMEOUT_MAX = 30;
static constexpr size_t   AP_PASSWORD_MIN       = 8;

namespace
{
  bool readBool(JsonVariantConst v, const char* key, bool& out)
  {
    if (v.isNull()) return false;
    if (!v.is<bool>()) {
      PD_LOGE(TAG, "%s: expected true/false, keeping %s", key, out ? "true" : "false");
      return false;
    }
    out = v.as<bool>();
    return true;
  }

  bool readUint(JsonVariantConst v, const char* key, uint32_t& out, uint32_t lo, uint32_t hi)
  {
    if (v.isNull()) return false;
    if (!v.is<long>() || v.as<long>() < (long)lo || v.as<long>() > (long)hi) {
      PD_LOGE(TAG, "%s: expected integer in [%u, %u], keeping %u",
              key, (unsigned)lo, (unsigned)hi, (unsigned)out);
      return false;
    }
    out = (uint32_t)v.as<long>();
    return true;
  }

  bool readPin(JsonVariantConst v, const char* key, int& out)
  {
    uint32_t pin = (uint32_t)out;
    if (!readUint(v, key, pin, 0, 48)) return false;
    out = (int)pin;
    return true;
  }

  bool readString(JsonVariantConst v, const char* key, std::string& out)
  {
    if (v.isNull()) return false;
    if (!v.is<const char*>()) {
      PD_LOGE(TAG, "%s: expected string, keeping '%s'", key, out.c_str());
      return false;
    }
    out = v.as<const char*>();
    return true;
  }

  void readPattern(JsonVariantConst v, const char* key, std::string& out)
  {
    std::string p = out;
    if (!readString(v, key, p)) return;
    if (!PatternClassifier::IsValidPattern(p)) {
      PD_LOGE(TAG, "%s: invalid pattern '%s', keeping '%s'", key, p.c_str(), out.c_str());
      return;
    }
    out = p;
  }

  // Absolute path with no empty or relative components
  bool isUsablePath(const std::string& p)
  {
    if (p.empty() || p[0] != '/' || p.back() == '/') return false;
    if (p.find("//") != std::string::npos) return false;
    if (p.find("/../") != std::string::npos || p.find("/./") != std::string::npos) return false;
    for (char c : p) {
      if (std::iscntrl((unsigned char)c)) return false;
    }
    return true;
  }

  void readPath(JsonVariantConst v, const char* key, std::string& out, bool allow_empty)
  {
    std::string p = out;
    if (!readString(v, key, p)) return;
    if (p.empty() && allow_empty) {
      out.clear();
      return;
    }
    if (!isUsablePath(p)) {
      PD_LOGE(TAG, "%s: invalid path '%s', keeping '%s'", key, p.c_str(), out.c_str());
      return;
    }
    out = p;
  }

  void readPosition(JsonVariantConst v, int& x, int& y)
  {
    if (v.isNull()) return;
    JsonArrayConst a = v.as<JsonArrayConst>();
    if (a.isNull() || a.size() != 2 || !a[0].is<int>() || !a[1].is<int>() ||
        a[0].as<int>() < 0 || a[1].as<int>() < 0) {
      PD_LOGE(TAG, "ui_position: expected [x, y], keeping [%d, %d]", x, y);
      return;
    }
    x = a[0].as<int>();
    y = a[1].as<int>();
  }
}

const char* FontSizeName(FontSize f) {
  switch (f) {
    case FontSize::Small:  return "small";
    case FontSize::Medium: return "medium";
    case FontSize::Bold:   return "bold";
    default:               return "small";
  }
}

bool ParseFontSize(const char* s, FontSize& out) {
  if (!s) return false;
  std::string lower(s);
  for (char& c : lower) c = (char)std::tolower((unsigned char)c);

  if (lower == "small")  { out = FontSize::Small; return true; }
  if (lower == "medium") { out = FontSize::Medium; return true; }
  if (lower == "bold")   { out = FontSize::Bold; return true; }
  return false;
}

bool LoadConfigJson(const std::string& text, DetectorConfig& cfg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    PD_LOGE(TAG, "config parse failed: %s", err.c_str());
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    PD_LOGE(TAG, "config root must be an object");
    return false;
  }

  JsonObjectConst root = doc.as<JsonObjectConst>();

  readBool(root["wifi_enabled"], "wifi_enabled", cfg.wifi_enabled);
  readBool(root["bluetooth_enabled"], "bluetooth_enabled", cfg.bluetooth_enabled);

  readPattern(root["pwn_pattern"], "pwn_pattern", cfg.pwn_pattern);
  readPattern(root["flipper_wifi_pattern"], "flipper_wifi_pattern", cfg.flipper_wifi_pattern);
  readPattern(root["flipper_bt_pattern"], "flipper_bt_pattern", cfg.flipper_bt_pattern);

  readUint(root["scan_interval"], "scan_interval", cfg.scan_interval_s, 0, 86400);
  readUint(root["discovery_timeout"], "discovery_timeout", cfg.discovery_timeout_s, 1, DISCOVERY_TIMEOUT_MAX);
  readUint(root["name_width"], "name_width", cfg.name_width, 1, NAME_WIDTH_MAX);
  readUint(root["rotation_window"], "rotation_window", cfg.rotation_window, 1, 32);
  readUint(root["rotation_interval"], "rotation_interval", cfg.rotation_interval_s, 0, 3600);

  readPath(root["log_file"], "log_file", cfg.log_file, true);
  readBool(root["notify"], "notify", cfg.notify);
  readPath(root["capture_dir"], "capture_dir", cfg.capture_dir, false);

  {
    std::string ext = cfg.sidecar_extension;
    if (readString(root["sidecar_extension"], "sidecar_extension", ext)) {
      if (ext.size() < 2 || ext[0] != '.' || ext.find('/') != std::string::npos) {
        PD_LOGE(TAG, "sidecar_extension: '%s' must start with '.', keeping '%s'",
                ext.c_str(), cfg.sidecar_extension.c_str());
      } else {
        cfg.sidecar_extension = ext;
      }
    }
  }

  readBool(root["gps_enabled"], "gps_enabled", cfg.gps_enabled);
  readUint(root["gps_baud"], "gps_baud", cfg.gps_baud, 4800, 921600);
  readPin(root["gps_rx"], "gps_rx", cfg.gps_rx);
  readPin(root["gps_tx"], "gps_tx", cfg.gps_tx);
  readUint(root["gps_timeout"], "gps_timeout", cfg.gps_timeout_ms, 50, 60000);

  readPosition(root["ui_position"], cfg.ui_x, cfg.ui_y);
  {
    std::string font = FontSizeName(cfg.font_size);
    if (readString(root["font_size"], "font_size", font)) {
      FontSize f;
      if (ParseFontSize(font.c_str(), f)) cfg.font_size = f;
      else PD_LOGE(TAG, "font_size: '%s' unknown, keeping '%s'", font.c_str(), FontSizeName(cfg.font_size));
    }
  }

  readBool(root["web_enabled"], "web_enabled", cfg.web_enabled);
  {
    std::string ssid = cfg.ap_ssid;
    if (readString(root["ap_ssid"], "ap_ssid", ssid)) {
      if (ssid.empty() || ssid.size() > 32) PD_LOGE(TAG, "ap_ssid: must be 1..32 chars, keeping '%s'", cfg.ap_ssid.c_str());
      else cfg.ap_ssid = ssid;
    }
    std::string pass = cfg.ap_password;
    if (readString(root["ap_password"], "ap_password", pass)) {
      if (!pass.empty() && (pass.size() < AP_PASSWORD_MIN || pass.size() > 63)) PD_LOGE(TAG, "ap_password: must be empty or 8..63 chars");
      else cfg.ap_password = pass;
    }
  }

  return true;
}

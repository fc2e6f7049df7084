#include "PatternClassifier.h"

#include "Log.h"

static constexpr const char* TAG = "classify";

bool PatternClassifier::Compile(const std::string& pattern, std::regex& out) {
  if (pattern.empty()) return false;
  try {
    out = std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
  } catch (const std::regex_error& e) {
    PD_LOGE(TAG, "bad pattern '%s': %s", pattern.c_str(), e.what());
    return false;
  }
  return true;
}

bool PatternClassifier::IsValidPattern(const std::string& pattern) {
  std::regex re;
  return Compile(pattern, re);
}

bool PatternClassifier::PrefixMatch(const std::regex& re, const std::string& name) {
  // match_continuous pins the match to position 0; trailing text is allowed
  return std::regex_search(name, re, std::regex_constants::match_continuous);
}

bool PatternClassifier::setPatterns(const std::string& pwn,
                                    const std::string& flipper_wifi,
                                    const std::string& flipper_bt) {
  std::regex p, fw, fb;
  if (!Compile(pwn, p) || !Compile(flipper_wifi, fw) || !Compile(flipper_bt, fb)) {
    return false;
  }

  _pwn = std::move(p);
  _flipperWifi = std::move(fw);
  _flipperBt = std::move(fb);
  _ready = true;

  PD_LOGI(TAG, "patterns pwn='%s' flipper_wifi='%s' flipper_bt='%s'",
          pwn.c_str(), flipper_wifi.c_str(), flipper_bt.c_str());
  return true;
}

bool PatternClassifier::classifyNetwork(const std::string& name, DeviceCategory& out) const {
  if (!_ready || name.empty()) return false;

  if (PrefixMatch(_pwn, name)) {
    out = DeviceCategory::PwnDevice;
    return true;
  }
  if (PrefixMatch(_flipperWifi, name)) {
    out = DeviceCategory::FlipperWifi;
    return true;
  }
  return false;
}

bool PatternClassifier::classifyDiscovery(const std::string& name, DeviceCategory& out) const {
  if (!_ready || name.empty()) return false;

  if (PrefixMatch(_flipperBt, name)) {
    out = DeviceCategory::FlipperBluetooth;
    return true;
  }
  return false;
}

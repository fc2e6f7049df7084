#pragma once

#include <regex>
#include <string>

#include "Device.h"

// Maps a broadcast name to a device category. Patterns are case-insensitive
// and only need to match at the start of the name.
class PatternClassifier {
public:
  // Compiles all three patterns; on failure nothing is replaced.
  bool setPatterns(const std::string& pwn,
                   const std::string& flipper_wifi,
                   const std::string& flipper_bt);

  bool ready() const { return _ready; }

  // Wi-Fi scan names: PwnDevice first, then FlipperWifi. First hit wins.
  bool classifyNetwork(const std::string& name, DeviceCategory& out) const;

  // Short-range discovery names: FlipperBluetooth only.
  bool classifyDiscovery(const std::string& name, DeviceCategory& out) const;

  static bool IsValidPattern(const std::string& pattern);

private:
  static bool Compile(const std::string& pattern, std::regex& out);
  static bool PrefixMatch(const std::regex& re, const std::string& name);

  std::regex _pwn;
  std::regex _flipperWifi;
  std::regex _flipperBt;
  bool       _ready = false;
};

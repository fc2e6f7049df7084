#include "Device.h"

#include <cctype>

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

DeviceGroup GroupOf(DeviceCategory c) {
  return (c == DeviceCategory::PwnDevice) ? DeviceGroup::Pwn : DeviceGroup::Flipper;
}

const char* CategoryName(DeviceCategory c) {
  switch (c) {
    case DeviceCategory::PwnDevice:        return "Pwnagotchi";
    case DeviceCategory::FlipperWifi:      return "WiFi";
    case DeviceCategory::FlipperBluetooth: return "Bluetooth";
    default:                               return "Unknown";
  }
}

bool NormalizeAddress(const std::string& in, std::string& out) {
  // Tolerate surrounding whitespace from scan drivers
  size_t b = 0, e = in.size();
  while (b < e && std::isspace((unsigned char)in[b])) b++;
  while (e > b && std::isspace((unsigned char)in[e - 1])) e--;

  static constexpr size_t MAC_TEXT_LEN = 17;
  if (e - b != MAC_TEXT_LEN) return false;

  const char sep = in[b + 2];
  if (sep != ':' && sep != '-') return false;

  std::string norm;
  norm.reserve(MAC_TEXT_LEN);
  for (size_t i = 0; i < MAC_TEXT_LEN; i++) {
    const char c = in[b + i];
    if (i % 3 == 2) {
      if (c != sep) return false;
      norm.push_back(':');
      continue;
    }
    if (hex_nibble(c) < 0) return false;
    norm.push_back((char)std::tolower((unsigned char)c));
  }

  out = norm;
  return true;
}

std::string TruncateName(const std::string& name, size_t max_chars) {
  if (name.size() <= max_chars) return name;

  size_t cut = max_chars;
  // back off continuation bytes (10xxxxxx)
  while (cut > 0 && ((unsigned char)name[cut] & 0xC0) == 0x80) cut--;
  return name.substr(0, cut);
}

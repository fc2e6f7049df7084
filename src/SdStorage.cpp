#include "SdStorage.h"

#include <SD.h>
#include <SPI.h>

#include "Log.h"

static constexpr const char* TAG = "sd";

static constexpr int SD_RETRY_COUNT = 3;
static constexpr int SD_RETRY_DELAY_MS = 10;

// SD can be busy with another task's write
static File openWithRetry(const char* path, const char* mode) {
  File f;
  for (int retry = 0; retry < SD_RETRY_COUNT; retry++) {
    f = SD.open(path, mode);
    if (f) return f;
    delay(SD_RETRY_DELAY_MS);
  }
  return f;
}

bool SdStorage::begin(int sck, int miso, int mosi, int cs) {
  SPI.begin(sck, miso, mosi, cs);
  _mounted = SD.begin(cs, SPI);
  if (!_mounted) PD_LOGW(TAG, "no SD card, detections will not be saved");
  else PD_LOGI(TAG, "SD mounted, %lluMB", (unsigned long long)(SD.cardSize() / (1024ULL * 1024ULL)));
  return _mounted;
}

bool SdStorage::append(const std::string& path, const std::string& line) {
  if (!_mounted) return false;
  File f = openWithRetry(path.c_str(), FILE_APPEND);
  if (!f) return false;

  const size_t want = line.size() + 1;
  size_t wrote = f.write((const uint8_t*)line.data(), line.size());
  wrote += f.write((uint8_t)'\n');
  f.close();
  return wrote == want;
}

bool SdStorage::write(const std::string& path, const std::string& content) {
  if (!_mounted) return false;
  File f = openWithRetry(path.c_str(), FILE_WRITE);
  if (!f) return false;

  const size_t wrote = f.write((const uint8_t*)content.data(), content.size());
  f.close();
  return wrote == content.size();
}

bool SdStorage::exists(const std::string& path) {
  return _mounted && SD.exists(path.c_str());
}

bool SdStorage::makeDirs(const std::string& dir) {
  if (!_mounted) return false;

  // SD.mkdir() creates one level at a time
  size_t pos = 1;
  while (pos <= dir.size()) {
    size_t next = dir.find('/', pos);
    if (next == std::string::npos) next = dir.size();
    const std::string part = dir.substr(0, next);
    if (!SD.exists(part.c_str()) && !SD.mkdir(part.c_str())) {
      PD_LOGE(TAG, "mkdir %s failed", part.c_str());
      return false;
    }
    pos = next + 1;
  }
  return true;
}

bool SdStorage::readAll(const std::string& path, std::string& out) {
  if (!_mounted || !SD.exists(path.c_str())) return false;
  File f = openWithRetry(path.c_str(), FILE_READ);
  if (!f) return false;

  out.clear();
  out.reserve(f.size());
  while (f.available()) {
    const int c = f.read();
    if (c < 0) break;
    out.push_back((char)c);
  }
  f.close();
  return true;
}

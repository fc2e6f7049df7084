#pragma once

#include "Storage.h"

// Storage on the SD card via the Arduino SD library.
class SdStorage : public Storage {
public:
  bool begin(int sck, int miso, int mosi, int cs);
  bool mounted() const { return _mounted; }

  bool append(const std::string& path, const std::string& line) override;
  bool write(const std::string& path, const std::string& content) override;
  bool exists(const std::string& path) override;
  bool makeDirs(const std::string& dir) override;

  // Whole-file read for small files (config); false if missing
  bool readAll(const std::string& path, std::string& out);

private:
  bool _mounted = false;
};

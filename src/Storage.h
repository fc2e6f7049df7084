#pragma once

#include <string>

// Where detection lines and location sidecars end up (SD card on device).
class Storage {
public:
  virtual ~Storage() = default;

  virtual bool append(const std::string& path, const std::string& line) = 0;  // adds '\n'
  virtual bool write(const std::string& path, const std::string& content) = 0;
  virtual bool exists(const std::string& path) = 0;
  virtual bool makeDirs(const std::string& dir) = 0;
};

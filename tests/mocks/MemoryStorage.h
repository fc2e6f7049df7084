#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "Storage.h"

// Files as strings; appends are also kept line by line for easy asserts.
class MemoryStorage : public Storage {
public:
  bool append(const std::string& path, const std::string& line) override {
    if (failWrites) return false;
    files[path] += line + "\n";
    lines[path].push_back(line);
    return true;
  }

  bool write(const std::string& path, const std::string& content) override {
    if (failWrites) return false;
    files[path] = content;
    return true;
  }

  bool exists(const std::string& path) override {
    return files.count(path) != 0 || dirs.count(path) != 0;
  }

  bool makeDirs(const std::string& dir) override {
    if (failMkdir) return false;
    dirs.insert(dir);
    return true;
  }

  bool failWrites = false;
  bool failMkdir = false;
  std::map<std::string, std::string> files;
  std::map<std::string, std::vector<std::string>> lines;
  std::set<std::string> dirs;
};

#include "CaptureTracker.h"

static constexpr const char* CAPTURE_SUFFIX = ".pcap";

bool CaptureTracker::IsCapture(const std::string& path) {
  const std::string suffix(CAPTURE_SUFFIX);
  const size_t slash = path.find_last_of('/');
  const size_t base = (slash == std::string::npos) ? 0 : slash + 1;

  // "/dir/.pcap" has no name of its own
  if (path.size() <= base + suffix.size()) return false;
  return path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> CaptureTracker::update(const Listing& listing) {
  std::vector<std::string> fresh;
  for (const std::string& path : listing) {
    if (!_seen.count(path)) fresh.push_back(path);
  }
  _seen = listing;
  return fresh;
}

#pragma once

#include <set>
#include <string>
#include <vector>

// Remembers which capture files were in the directory at the last look and
// reports the ones that appeared since. Deleted files are forgotten, so a
// capture written again under the same name is reported again.
class CaptureTracker {
public:
  typedef std::set<std::string> Listing;

  // Files present now are never reported.
  void prime(const Listing& listing) { _seen = listing; }

  // Returns paths not in the previous listing, in name order.
  std::vector<std::string> update(const Listing& listing);

  size_t tracked() const { return _seen.size(); }

  static bool IsCapture(const std::string& path);

private:
  Listing _seen;
};

#include "RotationProjector.h"

#include <algorithm>

std::vector<std::string> RotationProjector::VisibleWindow(const std::vector<std::string>& names,
                                                          size_t window,
                                                          size_t cursor) {
  std::vector<std::string> out;
  if (names.empty() || window == 0) return out;

  const size_t start = cursor % names.size();
  const size_t end = std::min(names.size(), start + window);
  out.assign(names.begin() + (std::ptrdiff_t)start, names.begin() + (std::ptrdiff_t)end);
  return out;
}

RotationState RotationProjector::Advance(const RotationState& s,
                                         size_t window,
                                         size_t length,
                                         uint32_t now_s,
                                         uint32_t interval_s) {
  RotationState out = s;
  if (length == 0) {
    out.cursor = 0;
    return out;
  }

  const uint32_t elapsed = (now_s > s.last_rotation_s) ? (now_s - s.last_rotation_s) : 0;
  if (elapsed > interval_s) {
    out.cursor = (s.cursor + window) % length;
    out.last_rotation_s = now_s;
  }
  return out;
}

std::vector<std::string> RotationProjector::Project(const std::string& header,
                                                    const std::vector<std::string>& names,
                                                    size_t window,
                                                    size_t cursor) {
  std::vector<std::string> lines;
  lines.reserve(1 + window);
  lines.push_back(header);

  std::vector<std::string> visible = VisibleWindow(names, window, cursor);
  lines.insert(lines.end(), visible.begin(), visible.end());
  return lines;
}

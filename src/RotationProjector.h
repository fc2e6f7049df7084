#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct RotationState {
  size_t   cursor = 0;
  uint32_t last_rotation_s = 0;
};

// Pages a list of names through a fixed-size window on the status text.
class RotationProjector {
public:
  // names[cursor % len .. +window], NOT wrapped: near the end of the list
  // fewer than `window` names come back.
  static std::vector<std::string> VisibleWindow(const std::vector<std::string>& names,
                                                size_t window,
                                                size_t cursor);

  // Moves the cursor by `window` (mod length) once more than interval_s has
  // passed since the last move. Length 0 always yields cursor 0.
  static RotationState Advance(const RotationState& s,
                               size_t window,
                               size_t length,
                               uint32_t now_s,
                               uint32_t interval_s);

  // Header line followed by the visible window.
  static std::vector<std::string> Project(const std::string& header,
                                          const std::vector<std::string>& names,
                                          size_t window,
                                          size_t cursor);
};

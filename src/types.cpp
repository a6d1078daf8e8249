/**
 * @file types.cpp
 * @brief LayoutMode construction and small helpers for core types
 */

#include "auto_shorts/types.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace auto_shorts {

bool CropRect::is_valid() const {
  return x >= 0.0 && y >= 0.0 && w > 0.0 && h > 0.0 &&
         x + w <= 1.0 + FRACTION_EPSILON && y + h <= 1.0 + FRACTION_EPSILON;
}

LayoutMode LayoutMode::passthrough() { return LayoutMode(); }

LayoutMode LayoutMode::split_screen(const SplitScreenLayout &split) {
  if (split.top_fraction <= 0.0 || split.top_fraction >= 1.0 ||
      split.bottom_fraction <= 0.0 || split.bottom_fraction >= 1.0) {
    throw std::invalid_argument(
        fmt::format("split fractions must be in (0, 1), got {}/{}",
                    split.top_fraction, split.bottom_fraction));
  }
  if (std::fabs(split.top_fraction + split.bottom_fraction - 1.0) >
      FRACTION_EPSILON) {
    throw std::invalid_argument(
        fmt::format("split fractions must add up to 1.0, got {} + {}",
                    split.top_fraction, split.bottom_fraction));
  }
  if (!split.camera.is_valid()) {
    throw std::invalid_argument("camera crop rectangle is out of bounds");
  }
  if (!split.content.is_valid()) {
    throw std::invalid_argument("content crop rectangle is out of bounds");
  }

  LayoutMode mode;
  mode.kind_ = Kind::SplitScreen;
  mode.split_ = split;
  return mode;
}

std::string LayoutMode::name() const {
  if (kind_ == Kind::Passthrough)
    return "passthrough";
  return fmt::format("split-screen {:.2f}/{:.2f}", split_.top_fraction,
                     split_.bottom_fraction);
}

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::ComposeError:
    return "ComposeError";
  case FailureKind::EncodeError:
    return "EncodeError";
  case FailureKind::AudioMuxFailure:
    return "AudioMuxFailure";
  case FailureKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

} // namespace auto_shorts

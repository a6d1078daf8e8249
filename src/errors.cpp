/**
 * @file errors.cpp
 * @brief Error kind names and FFmpeg error formatting
 */

#include "auto_shorts/errors.hpp"

extern "C" {
#include <libavutil/error.h>
}

#include <fmt/core.h>

namespace auto_shorts {

const char *to_string(AnalysisError::Kind kind) {
  switch (kind) {
  case AnalysisError::Kind::NoAudioTrack:
    return "NoAudioTrack";
  case AnalysisError::Kind::TooShort:
    return "TooShort";
  case AnalysisError::Kind::DecodeFailure:
    return "DecodeFailure";
  }
  return "Unknown";
}

const char *to_string(EncodeError::Kind kind) {
  switch (kind) {
  case EncodeError::Kind::EncoderFailed:
    return "EncoderFailed";
  case EncodeError::Kind::VerificationFailed:
    return "VerificationFailed";
  case EncodeError::Kind::AudioMuxFailure:
    return "AudioMuxFailure";
  }
  return "Unknown";
}

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0) {
    return fmt::format("FFmpeg error {}", errnum);
  }
  return buf;
}

} // namespace auto_shorts

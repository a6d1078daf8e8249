/**
 * @file errors.hpp
 * @brief Exception taxonomy for Auto Shorts
 *
 * @details Fatal errors (probe, analysis, acquisition, configuration) abort
 *          the run and reach the caller. ComposeError and EncodeError are
 *          thrown by the per-segment stages and converted into
 *          SegmentFailure entries by the pipeline.
 */

#ifndef AUTO_SHORTS_ERRORS_HPP
#define AUTO_SHORTS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace auto_shorts {

/**
 * @class Error
 * @brief Base class of every error raised by Auto Shorts.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

/// Source file unreadable, corrupt, or of zero duration
class ProbeError : public Error {
public:
  explicit ProbeError(const std::string &what) : Error(what) {}
};

/**
 * @class AnalysisError
 * @brief The score curve cannot be produced.
 */
class AnalysisError : public Error {
public:
  enum class Kind { NoAudioTrack, TooShort, DecodeFailure };

  AnalysisError(Kind kind, const std::string &what)
      : Error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

/// Composition of a single segment failed
class ComposeError : public Error {
public:
  explicit ComposeError(const std::string &what) : Error(what) {}
};

/**
 * @class EncodeError
 * @brief Final encoding of a single segment failed.
 * @note AudioMuxFailure means the artifact would have shipped without audio.
 */
class EncodeError : public Error {
public:
  enum class Kind { EncoderFailed, VerificationFailed, AudioMuxFailure };

  EncodeError(Kind kind, const std::string &what) : Error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

/// The acquisition collaborator could not provide a local file
class AcquisitionError : public Error {
public:
  explicit AcquisitionError(const std::string &what) : Error(what) {}
};

/// A configuration value could not be parsed
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &what) : Error(what) {}
};

const char *to_string(AnalysisError::Kind kind);
const char *to_string(EncodeError::Kind kind);

/**
 * @brief Render an FFmpeg error code as text (wraps av_strerror).
 */
std::string av_error_string(int errnum);

} // namespace auto_shorts

#endif // AUTO_SHORTS_ERRORS_HPP

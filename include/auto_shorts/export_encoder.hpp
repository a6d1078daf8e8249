/**
 * @file export_encoder.hpp
 * @brief Final encoding, verification and publication of one short
 *
 * @details ExportEncoder::encode() workflow:
 *
 *          1. Inspect the composed clip for an audio stream
 *
 *          2. Encode to the RenderSpec; resample and pad existing audio, or
 *             inject a silent track when there is none
 *
 *          3. Verify the encoded file (size, dimensions, fps, audio)
 *
 *          4. Publish with an atomic rename
 *
 *          ExportEncoder::thumbnail() optionally grabs a JPEG still from the
 *          published short and publishes it beside the video the same way.
 *
 * @attention Every published short has an audio stream. A file without one
 *            is rejected with EncodeError(AudioMuxFailure) and never reaches
 *            the final path.
 */

#ifndef AUTO_SHORTS_EXPORT_ENCODER_HPP
#define AUTO_SHORTS_EXPORT_ENCODER_HPP

#include <string>
#include <vector>

#include "command_runner.hpp"
#include "types.hpp"

namespace auto_shorts {

/// Maximum accepted difference between measured and requested frame rate
constexpr double FPS_TOLERANCE = 0.01;

/// Box a thumbnail is shrunk into, aspect ratio kept
constexpr int THUMBNAIL_MAX_WIDTH = 320;
constexpr int THUMBNAIL_MAX_HEIGHT = 180;

/**
 * @brief ffmpeg arguments for the final encode.
 *
 * @param input_has_audio false switches to an anullsrc silent track
 * @param duration Clip length; bounds the silent track
 */
std::vector<std::string> build_encode_args(const std::string &ffmpeg_bin,
                                           const std::string &input,
                                           bool input_has_audio,
                                           double duration,
                                           const RenderSpec &spec,
                                           const std::string &output);

/**
 * @brief ffmpeg arguments that write one JPEG frame taken at `at` seconds.
 */
std::vector<std::string> build_thumbnail_args(const std::string &ffmpeg_bin,
                                              const std::string &input,
                                              double at,
                                              const std::string &output);

/**
 * @brief Check an encoded file against the RenderSpec.
 * @return Stream description of the file
 * @throws EncodeError(AudioMuxFailure) without audio,
 *         EncodeError(VerificationFailed) for any other mismatch
 */
SourceVideo verify_output(const std::string &path, const RenderSpec &spec);

/**
 * @class ExportEncoder
 * @brief Turns a composed clip into a published ShortArtifact.
 */
class ExportEncoder {
public:
  ExportEncoder(CommandRunner &runner, std::string ffmpeg_bin = "ffmpeg");

  /**
   * @brief Encode, verify and publish one short.
   *
   * @param composed Intermediate clip from FrameComposer
   * @param segment Source span the clip covers
   * @param index 1-based presentation index
   * @param final_path Destination of the published file
   * @param work_dir Per-segment directory for the unverified encode
   * @throws EncodeError; nothing exists at final_path afterwards
   */
  ShortArtifact encode(const std::string &composed, const Segment &segment,
                       int index, const RenderSpec &spec,
                       const std::string &final_path,
                       const std::string &work_dir) const;

  /**
   * @brief Extract a still from the middle of a published short.
   *
   * @param artifact Published short
   * @param final_path Destination of the JPEG
   * @param work_dir Per-segment directory for the unpublished still
   * @return final_path, or "" if extraction failed (logged, not thrown)
   */
  std::string thumbnail(const ShortArtifact &artifact,
                        const std::string &final_path,
                        const std::string &work_dir) const;

private:
  CommandRunner &runner_;
  std::string ffmpeg_bin_;
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_EXPORT_ENCODER_HPP

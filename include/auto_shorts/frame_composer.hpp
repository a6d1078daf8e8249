/**
 * @file frame_composer.hpp
 * @brief Layout geometry and composition of one segment
 *
 * @details Composition happens in two steps:
 *
 *          1. plan_composition() turns a layout into pixel rectangles: which
 *             part of the source goes into which band of the output canvas
 *
 *          2. FrameComposer::compose() renders that plan for one segment by
 *             running ffmpeg with the matching filter graph
 *
 *          Every region is center-cropped to the aspect ratio of its band
 *          before scaling, so nothing is ever stretched. Optional captions
 *          are drawn on the finished canvas with drawtext.
 */

#ifndef AUTO_SHORTS_FRAME_COMPOSER_HPP
#define AUTO_SHORTS_FRAME_COMPOSER_HPP

#include <string>
#include <vector>

#include "command_runner.hpp"
#include "types.hpp"

namespace auto_shorts {

/**
 * @struct CompositionBand
 * @brief One horizontal band of the output canvas.
 */
struct CompositionBand {
  PixelRect source; //< Source region (even width/height)
  int width = 0;    //< Band width on the canvas
  int height = 0;   //< Band height on the canvas
  int y = 0;        //< Band top on the canvas
};

/**
 * @struct CompositionPlan
 * @brief Bands stacked top to bottom to fill width x height.
 */
struct CompositionPlan {
  int width = 0;
  int height = 0;
  std::vector<CompositionBand> bands;
};

/**
 * @brief Largest centered sub-rectangle of `region` with aspect
 *        target_w:target_h, with even dimensions.
 */
PixelRect center_crop(const PixelRect &region, int target_w, int target_h);

/**
 * @brief Convert a fractional crop into source pixels.
 */
PixelRect to_pixels(const CropRect &rect, int frame_w, int frame_h);

/**
 * @brief Compute the geometry for a layout.
 *
 * @details Passthrough yields one band covering the canvas. SplitScreen
 *          yields a top band of round(top_fraction * H) rows showing the
 *          camera region and a bottom band of the remaining rows showing the
 *          content region.
 *
 * @throws ComposeError if the source or RenderSpec has no usable size
 */
CompositionPlan plan_composition(const SourceVideo &source,
                                 const LayoutMode &layout,
                                 const RenderSpec &spec);

/**
 * @brief Escape text for a single-quoted drawtext option value.
 * @note ':' and '\\' are backslash-escaped; a quote becomes U+2019.
 */
std::string escape_drawtext(const std::string &text);

/**
 * @brief drawtext chain for the captions of a clip of `clip_duration` s.
 *
 * @details The intro is centered 50 px from the top during
 *          [0, min(intro_sec, L)]; the footer is centered 50 px above the
 *          bottom during [max(0, L - footer_sec), L]. Alpha ramps over
 *          fade_sec at both ends of each window.
 *
 * @return "" when the spec has no text
 */
std::string caption_filters(const CaptionSpec &captions, double clip_duration);

/**
 * @brief ffmpeg -filter_complex text for a plan. Output label is [v].
 * @param overlay Filters applied to the full canvas before the fps stage
 *        (e.g. the output of caption_filters()), "" for none
 */
std::string build_filter_graph(const CompositionPlan &plan, int fps,
                               const std::string &overlay = "");

/**
 * @class FrameComposer
 * @brief Produces the intermediate clip of one segment.
 */
class FrameComposer {
public:
  FrameComposer(CommandRunner &runner, std::string ffmpeg_bin = "ffmpeg");

  /**
   * @brief Render [segment.start, segment.end) of the source with the layout.
   *
   * @param work_dir Per-segment directory that receives the clip
   * @return Path of the intermediate Matroska clip (H.264, PCM audio when
   *         the source has audio)
   * @throws ComposeError if ffmpeg fails or leaves no output
   */
  std::string compose(const SourceVideo &source, const Segment &segment,
                      const LayoutMode &layout, const RenderSpec &spec,
                      const std::string &work_dir,
                      const CaptionSpec &captions = CaptionSpec()) const;

  /**
   * @brief ffmpeg argument vector used by compose().
   */
  std::vector<std::string>
  build_command(const SourceVideo &source, const Segment &segment,
                const CompositionPlan &plan, int fps, const std::string &output,
                const CaptionSpec &captions = CaptionSpec()) const;

private:
  CommandRunner &runner_;
  std::string ffmpeg_bin_;
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_FRAME_COMPOSER_HPP

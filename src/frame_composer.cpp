/**
 * @file frame_composer.cpp
 * @brief Layout planning and ffmpeg composition
 */

#include "auto_shorts/frame_composer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"

namespace auto_shorts {

namespace {

int even_floor(int v) { return std::max(2, v - (v % 2)); }

std::string crop_scale_chain(const CompositionBand &band) {
  return fmt::format("crop={}:{}:{}:{},scale={}:{},setsar=1", band.source.w,
                     band.source.h, band.source.x, band.source.y, band.width,
                     band.height);
}

/// Alpha expression for text shown during [from, to] with linear fades
std::string fade_alpha(double from, double to, double fade) {
  if (fade <= 0)
    return "1";
  return fmt::format("if(lt(t,{0:.2f}),(t-{1:.2f})/{2:.2f},"
                     "if(gt(t,{3:.2f}),({4:.2f}-t)/{2:.2f},1))",
                     from + fade, from, fade, to - fade, to);
}

std::string drawtext(const std::string &text, const CaptionSpec &captions,
                     int font_size, int border, const std::string &y,
                     double from, double to) {
  double fade = std::min(captions.fade_sec, (to - from) / 2.0);
  std::string filter = "drawtext=";
  if (!captions.font_file.empty())
    filter += fmt::format("fontfile='{}':", escape_drawtext(captions.font_file));
  filter += fmt::format(
      "text='{}':expansion=none:fontsize={}:fontcolor=white:borderw={}:"
      "bordercolor=black:x=(w-text_w)/2:y={}:"
      "enable='between(t,{:.2f},{:.2f})':alpha='{}'",
      escape_drawtext(text), font_size, border, y, from, to,
      fade_alpha(from, to, fade));
  return filter;
}

} // anonymous namespace

// **---- Captions ----**

std::string escape_drawtext(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\\' || c == ':')
      out += '\\';
    if (c == '\'')
      out += "\xe2\x80\x99";
    else
      out += c;
  }
  return out;
}

std::string caption_filters(const CaptionSpec &captions, double clip_duration) {
  if (captions.empty() || !(clip_duration > 0))
    return "";

  std::vector<std::string> stages;
  if (!captions.intro.empty()) {
    double end = std::min(captions.intro_sec, clip_duration);
    stages.push_back(drawtext(captions.intro, captions, captions.font_size, 3,
                              "50", 0.0, end));
  }
  if (!captions.footer.empty()) {
    double begin = std::max(0.0, clip_duration - captions.footer_sec);
    stages.push_back(drawtext(captions.footer, captions,
                              std::max(1, captions.font_size - 10), 2,
                              "h-text_h-50", begin, clip_duration));
  }

  std::string chain;
  for (const auto &stage : stages) {
    if (!chain.empty())
      chain += ',';
    chain += stage;
  }
  return chain;
}

// **---- Geometry ----**

PixelRect center_crop(const PixelRect &region, int target_w, int target_h) {
  int64_t rw = region.w;
  int64_t rh = region.h;
  int64_t cw, ch;

  if (rw * target_h > rh * target_w) {
    /// Region is wider than the target: trim the sides
    ch = rh;
    cw = rh * target_w / target_h;
  } else {
    cw = rw;
    ch = rw * target_h / target_w;
  }

  PixelRect out;
  out.w = std::min(even_floor(static_cast<int>(cw)), std::max(2, region.w));
  out.h = std::min(even_floor(static_cast<int>(ch)), std::max(2, region.h));
  out.x = region.x + (region.w - out.w) / 2;
  out.y = region.y + (region.h - out.h) / 2;
  return out;
}

PixelRect to_pixels(const CropRect &rect, int frame_w, int frame_h) {
  PixelRect px;
  px.x = static_cast<int>(std::lround(rect.x * frame_w));
  px.y = static_cast<int>(std::lround(rect.y * frame_h));
  px.w = static_cast<int>(std::lround(rect.w * frame_w));
  px.h = static_cast<int>(std::lround(rect.h * frame_h));

  px.x = std::clamp(px.x, 0, std::max(0, frame_w - 2));
  px.y = std::clamp(px.y, 0, std::max(0, frame_h - 2));
  px.w = std::clamp(px.w, 2, frame_w - px.x);
  px.h = std::clamp(px.h, 2, frame_h - px.y);
  return px;
}

CompositionPlan plan_composition(const SourceVideo &source,
                                 const LayoutMode &layout,
                                 const RenderSpec &spec) {
  if (source.width < 2 || source.height < 2) {
    throw ComposeError(fmt::format("source frame {}x{} is too small to crop",
                                   source.width, source.height));
  }
  if (spec.width <= 0 || spec.height <= 0) {
    throw ComposeError(fmt::format("invalid output size {}x{}", spec.width,
                                   spec.height));
  }

  CompositionPlan plan;
  plan.width = spec.width;
  plan.height = spec.height;

  if (!layout.is_split_screen()) {
    CompositionBand band;
    band.width = spec.width;
    band.height = spec.height;
    band.y = 0;
    band.source = center_crop({0, 0, source.width, source.height}, band.width,
                              band.height);
    plan.bands.push_back(band);
    return plan;
  }

  const SplitScreenLayout &split = layout.split();
  int top_h = static_cast<int>(std::lround(split.top_fraction * spec.height));
  top_h = std::clamp(top_h, 1, spec.height - 1);

  CompositionBand top;
  top.width = spec.width;
  top.height = top_h;
  top.y = 0;
  top.source = center_crop(to_pixels(split.camera, source.width, source.height),
                           top.width, top.height);

  CompositionBand bottom;
  bottom.width = spec.width;
  bottom.height = spec.height - top_h;
  bottom.y = top_h;
  bottom.source =
      center_crop(to_pixels(split.content, source.width, source.height),
                  bottom.width, bottom.height);

  plan.bands.push_back(top);
  plan.bands.push_back(bottom);
  return plan;
}

std::string build_filter_graph(const CompositionPlan &plan, int fps,
                               const std::string &overlay) {
  std::string tail = fmt::format("fps={},format=yuv420p[v]", fps);
  if (!overlay.empty())
    tail = overlay + "," + tail;

  if (plan.bands.size() == 1) {
    return fmt::format("[0:v]{},{}", crop_scale_chain(plan.bands[0]), tail);
  }

  std::string graph = fmt::format("[0:v]split={}", plan.bands.size());
  for (size_t i = 0; i < plan.bands.size(); ++i)
    graph += fmt::format("[in{}]", i);

  std::string stack_inputs;
  for (size_t i = 0; i < plan.bands.size(); ++i) {
    graph += fmt::format(";[in{}]{}[band{}]", i,
                         crop_scale_chain(plan.bands[i]), i);
    stack_inputs += fmt::format("[band{}]", i);
  }
  graph += fmt::format(";{}vstack=inputs={},{}", stack_inputs,
                       plan.bands.size(), tail);
  return graph;
}

// **---- FrameComposer ----**

FrameComposer::FrameComposer(CommandRunner &runner, std::string ffmpeg_bin)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::vector<std::string>
FrameComposer::build_command(const SourceVideo &source, const Segment &segment,
                             const CompositionPlan &plan, int fps,
                             const std::string &output,
                             const CaptionSpec &captions) const {
  std::vector<std::string> args = {
      ffmpeg_bin_,
      "-y",
      "-hide_banner",
      "-loglevel",
      "error",
      "-ss",
      fmt::format("{:.3f}", segment.start),
      "-t",
      fmt::format("{:.3f}", segment.length()),
      "-i",
      source.path,
      "-filter_complex",
      build_filter_graph(plan, fps,
                         caption_filters(captions, segment.length())),
      "-map",
      "[v]",
  };

  if (source.has_audio) {
    args.insert(args.end(), {"-map", "0:a:0", "-c:a", "pcm_s16le"});
  }

  /// Near-lossless intermediate; the export step sets the final bitrate
  args.insert(args.end(), {"-c:v", "libx264", "-preset", "veryfast", "-crf",
                           "18", "-f", "matroska", output});
  return args;
}

std::string FrameComposer::compose(const SourceVideo &source,
                                   const Segment &segment,
                                   const LayoutMode &layout,
                                   const RenderSpec &spec,
                                   const std::string &work_dir,
                                   const CaptionSpec &captions) const {
  namespace fs = std::filesystem;

  CompositionPlan plan = plan_composition(source, layout, spec);
  std::string output = (fs::path(work_dir) / "composed.mkv").string();

  int status =
      runner_.run(build_command(source, segment, plan, spec.fps, output,
                                captions));
  if (status != 0) {
    throw ComposeError(fmt::format(
        "ffmpeg composition of {:.1f}s-{:.1f}s failed (exit code {})",
        segment.start, segment.end, status));
  }

  std::error_code ec;
  auto size = fs::file_size(output, ec);
  if (ec || size == 0) {
    throw ComposeError(
        fmt::format("ffmpeg produced no composed clip at {}", output));
  }
  return output;
}

} // namespace auto_shorts

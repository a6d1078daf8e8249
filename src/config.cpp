/**
 * @file config.cpp
 * @brief Environment-driven configuration loading
 */

#include "auto_shorts/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"

namespace auto_shorts {

// **---- PipelineConfig ----**

RenderSpec PipelineConfig::render_spec_for(const LayoutMode &layout) const {
  RenderSpec spec = render;
  if (!resolution_override) {
    if (layout.is_split_screen()) {
      spec.width = 1080;
      spec.height = 1920;
    } else {
      spec.width = 720;
      spec.height = 1280;
    }
  }
  return spec;
}

void PipelineConfig::validate() const {
  if (!(short_duration_sec > 0))
    throw ConfigError("SHORT_DURATION_SEC must be > 0");
  if (count_per_video < 0)
    throw ConfigError("COUNT_PER_VIDEO must be >= 0");
  if (min_gap_sec < 0)
    throw ConfigError("MIN_GAP_SEC must be >= 0");
  if (!(window_sec > 0))
    throw ConfigError("SCORE_WINDOW_SEC must be > 0");
  if (smoothing_windows < 1)
    throw ConfigError("SMOOTHING_WINDOWS must be >= 1");
  if (!(chunk_duration_sec > 0))
    throw ConfigError("CHUNK_DURATION_SEC must be > 0");
  if (analysis_threads < 0)
    throw ConfigError("ANALYSIS_THREADS must be >= 0");
  if (max_concurrent < 1)
    throw ConfigError("MAX_CONCURRENT must be >= 1");
  if (render.fps <= 0)
    throw ConfigError("OUTPUT_FPS must be > 0");
  if (render.width <= 0 || render.height <= 0)
    throw ConfigError("OUTPUT_RESOLUTION must be positive");
  if (render.audio_sample_rate <= 0)
    throw ConfigError("AUDIO_SAMPLE_RATE must be > 0");
  if (output_dir.empty())
    throw ConfigError("OUTPUT_DIR must not be empty");
  if (caption_font_size <= 10)
    throw ConfigError("CAPTION_FONT_SIZE must be > 10");
}

// **---- Environment readers ----**

namespace Config {

double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    size_t used = 0;
    double parsed = std::stod(val, &used);
    if (used != std::string(val).size())
      throw std::invalid_argument(val);
    return parsed;
  } catch (const std::logic_error &) {
    throw ConfigError(fmt::format("{}: '{}' is not a number", name, val));
  }
}

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    size_t used = 0;
    int parsed = std::stoi(val, &used);
    if (used != std::string(val).size())
      throw std::invalid_argument(val);
    return parsed;
  } catch (const std::logic_error &) {
    throw ConfigError(fmt::format("{}: '{}' is not an integer", name, val));
  }
}

std::string get_env_string(const char *name, const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  std::string text = val;
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (text == "1" || text == "true" || text == "yes" || text == "on")
    return true;
  if (text == "0" || text == "false" || text == "no" || text == "off")
    return false;
  throw ConfigError(fmt::format("{}: '{}' is not a flag (use 1 or 0)", name, val));
}

std::vector<std::string> parse_list(const std::string &text) {
  std::vector<std::string> items;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t first = item.find_first_not_of(" \t");
    if (first == std::string::npos)
      continue;
    size_t last = item.find_last_not_of(" \t");
    items.push_back(item.substr(first, last - first + 1));
  }
  return items;
}

void parse_resolution(const std::string &text, int &width, int &height) {
  size_t x = text.find_first_of("xX");
  if (x == std::string::npos || x == 0 || x + 1 >= text.size()) {
    throw ConfigError(fmt::format("resolution '{}' is not WIDTHxHEIGHT", text));
  }
  try {
    size_t used_w = 0, used_h = 0;
    std::string w_text = text.substr(0, x);
    std::string h_text = text.substr(x + 1);
    int w = std::stoi(w_text, &used_w);
    int h = std::stoi(h_text, &used_h);
    if (used_w != w_text.size() || used_h != h_text.size())
      throw std::invalid_argument(text);
    /// libx264 with yuv420p needs even dimensions
    if (w <= 0 || h <= 0 || w % 2 != 0 || h % 2 != 0) {
      throw ConfigError(fmt::format(
          "resolution '{}' must have positive, even dimensions", text));
    }
    width = w;
    height = h;
  } catch (const std::logic_error &) {
    throw ConfigError(fmt::format("resolution '{}' is not WIDTHxHEIGHT", text));
  }
}

CropRect parse_crop_rect(const std::string &text) {
  std::vector<double> parts;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    try {
      size_t used = 0;
      parts.push_back(std::stod(item, &used));
      while (used < item.size() && std::isspace(static_cast<unsigned char>(item[used])))
        ++used;
      if (used != item.size())
        throw std::invalid_argument(item);
    } catch (const std::logic_error &) {
      throw ConfigError(fmt::format("crop '{}': '{}' is not a number", text, item));
    }
  }
  if (parts.size() != 4) {
    throw ConfigError(fmt::format("crop '{}' must be x,y,w,h", text));
  }
  CropRect rect{parts[0], parts[1], parts[2], parts[3]};
  if (!rect.is_valid()) {
    throw ConfigError(
        fmt::format("crop '{}' must lie within the unit square", text));
  }
  return rect;
}

} // namespace Config

// **---- Loader ----**

PipelineConfig load_pipeline_config() {
  PipelineConfig cfg;

  cfg.short_duration_sec =
      Config::get_env_double("SHORT_DURATION_SEC", cfg.short_duration_sec);
  cfg.count_per_video = Config::get_env_int("COUNT_PER_VIDEO", cfg.count_per_video);
  cfg.min_gap_sec = Config::get_env_double("MIN_GAP_SEC", cfg.min_gap_sec);

  cfg.window_sec = Config::get_env_double("SCORE_WINDOW_SEC", cfg.window_sec);
  cfg.smoothing_windows =
      Config::get_env_int("SMOOTHING_WINDOWS", cfg.smoothing_windows);
  cfg.chunk_duration_sec =
      Config::get_env_double("CHUNK_DURATION_SEC", cfg.chunk_duration_sec);
  cfg.analysis_threads =
      Config::get_env_int("ANALYSIS_THREADS", cfg.analysis_threads);

  std::string resolution = Config::get_env_string("OUTPUT_RESOLUTION", "");
  if (!resolution.empty()) {
    Config::parse_resolution(resolution, cfg.render.width, cfg.render.height);
    cfg.resolution_override = true;
  }
  cfg.render.fps = Config::get_env_int("OUTPUT_FPS", cfg.render.fps);
  cfg.render.video_bitrate =
      Config::get_env_string("VIDEO_BITRATE", cfg.render.video_bitrate);
  cfg.render.audio_bitrate =
      Config::get_env_string("AUDIO_BITRATE", cfg.render.audio_bitrate);
  cfg.render.video_codec =
      Config::get_env_string("VIDEO_CODEC", cfg.render.video_codec);
  cfg.render.audio_codec =
      Config::get_env_string("AUDIO_CODEC", cfg.render.audio_codec);
  cfg.render.audio_sample_rate =
      Config::get_env_int("AUDIO_SAMPLE_RATE", cfg.render.audio_sample_rate);

  double top = Config::get_env_double("SPLIT_TOP_FRACTION", cfg.split.top_fraction);
  cfg.split.top_fraction = top;
  cfg.split.bottom_fraction = 1.0 - top;
  std::string camera = Config::get_env_string("CAMERA_CROP", "");
  if (!camera.empty())
    cfg.split.camera = Config::parse_crop_rect(camera);
  std::string content = Config::get_env_string("CONTENT_CROP", "");
  if (!content.empty())
    cfg.split.content = Config::parse_crop_rect(content);
  if (!(top > 0.0 && top < 1.0))
    throw ConfigError("SPLIT_TOP_FRACTION must be in (0, 1)");

  cfg.max_concurrent = Config::get_env_int("MAX_CONCURRENT", cfg.max_concurrent);
  cfg.temp_dir = Config::get_env_string("TEMP_DIR", cfg.temp_dir);
  cfg.output_dir = Config::get_env_string("OUTPUT_DIR", cfg.output_dir);
  cfg.download_dir = Config::get_env_string("DOWNLOAD_DIR", cfg.download_dir);
  cfg.ffmpeg_bin = Config::get_env_string("FFMPEG_BIN", cfg.ffmpeg_bin);
  cfg.ytdlp_bin = Config::get_env_string("YTDLP_BIN", cfg.ytdlp_bin);

  cfg.overlay_text = Config::get_env_bool("OVERLAY_TEXT", cfg.overlay_text);
  cfg.caption_label = Config::get_env_string("CAPTION_LABEL", cfg.caption_label);
  cfg.caption_font_size =
      Config::get_env_int("CAPTION_FONT_SIZE", cfg.caption_font_size);
  cfg.font_file = Config::get_env_string("FONT_FILE", cfg.font_file);
  cfg.hashtags = Config::parse_list(Config::get_env_string("HASHTAGS", ""));
  cfg.thumbnails = Config::get_env_bool("THUMBNAILS", cfg.thumbnails);
  cfg.write_metadata = Config::get_env_bool("WRITE_METADATA", cfg.write_metadata);

  cfg.validate();
  return cfg;
}

} // namespace auto_shorts

/**
 * @file config.hpp
 * @brief Configuration loaded from environment variables
 *
 * @details The Config namespace holds typed environment readers. main()
 *          calls load_pipeline_config() once and passes the resulting
 *          PipelineConfig by value into the pipeline; nothing reads the
 *          environment after that. See config/auto_shorts.env for the
 *          documented variables.
 */

#ifndef AUTO_SHORTS_CONFIG_HPP
#define AUTO_SHORTS_CONFIG_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace auto_shorts {

/**
 * @struct PipelineConfig
 * @brief Immutable run configuration.
 * @note Defaults match the documented environment defaults, so tests can
 *       build one directly and override what they need.
 */
struct PipelineConfig {
  // **---- SELECTION ----**
  double short_duration_sec = 60.0; //< Fixed length of every short
  int count_per_video = 7;          //< Shorts requested when the CLI omits it
  double min_gap_sec = 0.0;         //< Extra spacing between selected shorts

  // **---- ANALYSIS ----**
  double window_sec = 1.0;          //< Score curve step
  int smoothing_windows = 3;        //< Moving average width (1 = off)
  double chunk_duration_sec = 60.0; //< Analyzer work unit
  int analysis_threads = 0;         //< 0 = detected CPU limit

  // **---- RENDERING ----**
  bool resolution_override = false; //< OUTPUT_RESOLUTION was given
  RenderSpec render;                //< Used as-is when resolution_override
  SplitScreenLayout split;

  // **---- EXECUTION ----**
  int max_concurrent = 2;           //< Parallel compose+encode jobs
  std::string temp_dir;             //< Empty = system temp directory
  std::string output_dir = "shorts";
  std::string download_dir = "downloads";
  std::string ffmpeg_bin = "ffmpeg";
  std::string ytdlp_bin = "yt-dlp";

  // **---- EXTRAS ----**
  bool overlay_text = false;          //< Burn in intro caption and footer
  std::string caption_label = "Parte"; //< Intro reads "<label> i/N"
  int caption_font_size = 60;
  std::string font_file;              //< Empty = fontconfig default
  std::vector<std::string> hashtags;  //< Footer and metadata tags
  bool thumbnails = false;            //< JPEG still beside every short
  bool write_metadata = false;        //< JSON sidecar beside every short

  /**
   * @brief RenderSpec for a layout.
   * @note Without an explicit resolution, Passthrough renders 720x1280 and
   *       SplitScreen renders 1080x1920.
   */
  RenderSpec render_spec_for(const LayoutMode &layout) const;

  /**
   * @brief Check ranges (durations > 0, counts >= 0, concurrency >= 1...).
   * @throws ConfigError describing the first invalid field
   */
  void validate() const;
};

namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @throws ConfigError if the value is not a number
 */
double get_env_double(const char *name, double default_val);

/**
 * @brief Get an integer value from environment variable.
 * @throws ConfigError if the value is not an integer
 */
int get_env_int(const char *name, int default_val);

/// Get a string value from environment variable (empty counts as unset)
std::string get_env_string(const char *name, const std::string &default_val);

/**
 * @brief Get a flag from environment variable.
 * @note Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
 * @throws ConfigError for anything else
 */
bool get_env_bool(const char *name, bool default_val);

/**
 * @brief Split a comma-separated list, trimming blanks and dropping empties.
 */
std::vector<std::string> parse_list(const std::string &text);

/**
 * @brief Parse "WIDTHxHEIGHT" (e.g. "1080x1920").
 * @throws ConfigError on malformed input or odd/non-positive dimensions
 */
void parse_resolution(const std::string &text, int &width, int &height);

/**
 * @brief Parse "x,y,w,h" fractions of the source frame.
 * @throws ConfigError on malformed or out-of-bounds input
 */
CropRect parse_crop_rect(const std::string &text);

} // namespace Config

/**
 * @brief Build the run configuration from the environment.
 * @throws ConfigError on malformed or out-of-range values
 */
PipelineConfig load_pipeline_config();

} // namespace auto_shorts

#endif // AUTO_SHORTS_CONFIG_HPP

/**
 * @file acquisition.hpp
 * @brief Resolving the CLI source argument to a local media file
 *
 * @details A local path is used as-is. An http(s) URL is downloaded with
 *          yt-dlp into a fresh subdirectory of the download directory
 *          (best stream up to 1080p, merged to mp4, restricted file names).
 */

#ifndef AUTO_SHORTS_ACQUISITION_HPP
#define AUTO_SHORTS_ACQUISITION_HPP

#include <string>
#include <vector>

#include "command_runner.hpp"

namespace auto_shorts {

/**
 * @brief true for arguments starting with http:// or https://
 */
bool is_remote_source(const std::string &arg);

/**
 * @brief yt-dlp arguments for downloading `url` into `target_dir`.
 */
std::vector<std::string> build_download_args(const std::string &ytdlp_bin,
                                             const std::string &url,
                                             const std::string &target_dir);

/**
 * @brief Resolve `arg` to a local file.
 *
 * @param arg Local path or http(s) URL
 * @param download_dir Parent directory for downloads
 * @param runner Launches yt-dlp
 * @param ytdlp_bin yt-dlp executable
 * @return Path of an existing regular file
 * @throws AcquisitionError if the path does not exist, the argument is
 *         neither a file nor a URL, or the download fails
 */
std::string acquire_source(const std::string &arg,
                           const std::string &download_dir,
                           CommandRunner &runner,
                           const std::string &ytdlp_bin = "yt-dlp");

} // namespace auto_shorts

#endif // AUTO_SHORTS_ACQUISITION_HPP

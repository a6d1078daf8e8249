/**
 * @file acquisition.cpp
 * @brief Local file pass-through and yt-dlp downloads
 */

#include "auto_shorts/acquisition.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <stdlib.h>

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"

namespace auto_shorts {

namespace fs = std::filesystem;

namespace {

/// Unique, persistent directory for one download
std::string make_download_dir(const std::string &parent) {
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw AcquisitionError(fmt::format("cannot create download dir {}: {}",
                                       parent, ec.message()));
  }

  std::string pattern = (fs::path(parent) / "download_XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw AcquisitionError(fmt::format("mkdtemp {}: {}", pattern,
                                       std::strerror(errno)));
  }
  return buf.data();
}

/// Largest finished file yt-dlp left in `dir`
std::string find_downloaded_file(const std::string &dir) {
  std::string best;
  uintmax_t best_size = 0;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    std::string ext = entry.path().extension().string();
    if (ext == ".part" || ext == ".ytdl")
      continue;
    uintmax_t size = entry.file_size();
    if (best.empty() || size > best_size) {
      best = entry.path().string();
      best_size = size;
    }
  }
  return best;
}

} // anonymous namespace

bool is_remote_source(const std::string &arg) {
  return arg.rfind("http://", 0) == 0 || arg.rfind("https://", 0) == 0;
}

std::vector<std::string> build_download_args(const std::string &ytdlp_bin,
                                             const std::string &url,
                                             const std::string &target_dir) {
  return {ytdlp_bin,
          "--no-playlist",
          "--restrict-filenames",
          "-f",
          "best[height<=1080]",
          "--merge-output-format",
          "mp4",
          "-o",
          (fs::path(target_dir) / "%(title)s.%(ext)s").string(),
          url};
}

std::string acquire_source(const std::string &arg,
                           const std::string &download_dir,
                           CommandRunner &runner,
                           const std::string &ytdlp_bin) {
  if (!is_remote_source(arg)) {
    std::error_code ec;
    if (!fs::is_regular_file(arg, ec)) {
      throw AcquisitionError(
          fmt::format("'{}' is neither an existing file nor an http(s) URL",
                      arg));
    }
    return arg;
  }

  std::string target = make_download_dir(download_dir);
  LOG_PHASE("Downloading {}...", arg);

  int status = runner.run(build_download_args(ytdlp_bin, arg, target));
  if (status != 0) {
    throw AcquisitionError(
        fmt::format("yt-dlp failed for {} (exit code {})", arg, status));
  }

  std::string file;
  try {
    file = find_downloaded_file(target);
  } catch (const fs::filesystem_error &e) {
    throw AcquisitionError(fmt::format("cannot list {}: {}", target, e.what()));
  }
  if (file.empty()) {
    throw AcquisitionError(
        fmt::format("yt-dlp reported success but {} is empty", target));
  }

  LOG_SUCCESS("Downloaded: {}", file);
  return file;
}

} // namespace auto_shorts

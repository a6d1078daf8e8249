/**
 * @file temp_dir.cpp
 * @brief Temporary directory and publication helpers
 */

#include "auto_shorts/temp_dir.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include <stdlib.h>

#include "auto_shorts/logging.hpp"

namespace auto_shorts {

namespace fs = std::filesystem;

// **---- ScopedTempDir ----**

ScopedTempDir::ScopedTempDir(const std::string &parent,
                             const std::string &prefix) {
  fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
  fs::create_directories(base);

  std::string pattern = (base / (prefix + "_XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (!mkdtemp(buf.data())) {
    throw std::system_error(errno, std::generic_category(),
                            "mkdtemp " + pattern);
  }
  path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Could not remove temp dir {}: {}", path_, ec.message());
  }
}

std::string ScopedTempDir::subdir(const std::string &name) const {
  fs::path dir = fs::path(path_) / name;
  fs::create_directories(dir);
  return dir.string();
}

// **---- Publication ----**

void publish_atomically(const std::string &from, const std::string &to) {
  fs::path dst(to);
  if (dst.has_parent_path())
    fs::create_directories(dst.parent_path());

  std::error_code ec;
  fs::rename(from, dst, ec);
  if (!ec)
    return;
  if (ec != std::errc::cross_device_link)
    throw fs::filesystem_error("rename", fs::path(from), dst, ec);

  /// Different filesystems: stage beside the destination, then rename
  fs::path staging =
      dst.parent_path() / ("." + dst.filename().string() + ".partial");
  try {
    fs::copy_file(from, staging, fs::copy_options::overwrite_existing);
    fs::rename(staging, dst);
  } catch (const fs::filesystem_error &) {
    std::error_code cleanup_ec;
    fs::remove(staging, cleanup_ec);
    throw;
  }
  fs::remove(from, ec);
  if (ec)
    LOG_WARN("Published {} but could not remove {}: {}", to, from,
             ec.message());
}

} // namespace auto_shorts

/**
 * @file temp_dir.hpp
 * @brief Scoped temporary directories and atomic file publication
 */

#ifndef AUTO_SHORTS_TEMP_DIR_HPP
#define AUTO_SHORTS_TEMP_DIR_HPP

#include <string>

namespace auto_shorts {

/**
 * @class ScopedTempDir
 * @brief Unique directory that is removed with its contents on destruction.
 *
 * @attention MANAGEMENT:
 *            - Created with mkdtemp(), so concurrent runs never collide
 *
 *            - Removal errors are logged, never thrown from the destructor
 */
class ScopedTempDir {
public:
  /**
   * @param parent Directory to create in (empty = system temp directory)
   * @param prefix Leading part of the directory name
   * @throws std::system_error if the directory cannot be created
   */
  explicit ScopedTempDir(const std::string &parent = "",
                         const std::string &prefix = "auto_shorts");
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  const std::string &path() const { return path_; }

  /**
   * @brief Create (or reuse) a subdirectory and return its path.
   * @throws std::filesystem::filesystem_error
   */
  std::string subdir(const std::string &name) const;

private:
  std::string path_;
};

/**
 * @brief Move a finished file to its final path in one step.
 *
 * @details rename(2) when both paths share a filesystem. Across devices the
 *          file is copied to a hidden sibling of the destination first and
 *          that sibling is renamed, so the destination never holds a partial
 *          file.
 *
 * @throws std::filesystem::filesystem_error on failure (the destination is
 *         left untouched)
 */
void publish_atomically(const std::string &from, const std::string &to);

} // namespace auto_shorts

#endif // AUTO_SHORTS_TEMP_DIR_HPP

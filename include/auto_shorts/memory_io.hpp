/**
 * @file memory_io.hpp
 * @brief Memory-mapped source file with FFmpeg custom I/O on top
 *
 * @details Provides:
 *          - MappedFile: RAII read-only mmap of the source, shared by all
 *            analyzer workers
 *
 *          - MemoryReader: per-worker AVIOContext reading from a MappedFile
 */

#ifndef AUTO_SHORTS_MEMORY_IO_HPP
#define AUTO_SHORTS_MEMORY_IO_HPP

extern "C" {
#include <libavformat/avio.h>
}

#include <cstdint>
#include <string>

#include "types.hpp"

namespace auto_shorts {

/**
 * @class MappedFile
 * @brief RAII wrapper for a read-only memory-mapped file.
 * @note Move-only. The mapping stays valid until destruction, so readers
 *       must not outlive it.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  /**
   * @brief Map an entire file into memory.
   * @throws std::system_error if the file cannot be opened, is empty, or
   *         cannot be mapped
   */
  static MappedFile map(const std::string &path);

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

private:
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryReader
 * @brief Owns an AVIOContext that reads from a MappedFile.
 *
 * @attention Hand context() to an AVFormatContext together with
 *            AVFMT_FLAG_CUSTOM_IO. avformat_close_input() does not free a
 *            custom AVIOContext, so this class always does.
 */
class MemoryReader {
public:
  /**
   * @throws std::bad_alloc if the buffer or context cannot be allocated
   */
  explicit MemoryReader(const MappedFile &file);
  ~MemoryReader();

  MemoryReader(const MemoryReader &) = delete;
  MemoryReader &operator=(const MemoryReader &) = delete;

  AVIOContext *context() const { return avio_ctx_; }

private:
  /**
   * @brief State for the read/seek callbacks.
   * @note Cache-line aligned; touched on every demuxer read.
   */
  struct alignas(CACHE_LINE_SIZE) State {
    const uint8_t *ptr; //< Buffer start
    size_t size;        //< Total buffer size
    size_t pos;         //< Current read position
  };

  static int read(void *opaque, uint8_t *buf, int buf_size);
  static int64_t seek(void *opaque, int64_t offset, int whence);

  State state_;
  AVIOContext *avio_ctx_ = nullptr;
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_MEMORY_IO_HPP

/**
 * @file memory_io.cpp
 * @brief Memory-mapped file and FFmpeg custom I/O implementation
 */

#include "auto_shorts/memory_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace auto_shorts {

// **---- MappedFile Implementation ----**

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::release() {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ != -1) {
    close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

MappedFile MappedFile::map(const std::string &path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "open " + path);
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    int err = errno;
    close(fd);
    throw std::system_error(err, std::generic_category(), "stat " + path);
  }

  if (sb.st_size <= 0) {
    close(fd);
    throw std::system_error(EINVAL, std::generic_category(),
                            "empty file " + path);
  }

  /// MAP_PRIVATE: read-only view, the source is never modified
  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    int err = errno;
    close(fd);
    throw std::system_error(err, std::generic_category(), "mmap " + path);
  }

  /// Workers read their chunks front to back
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  MappedFile file;
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.fd_ = fd;
  return file;
}

// **---- MemoryReader Implementation ----**

MemoryReader::MemoryReader(const MappedFile &file)
    : state_{file.data(), file.size(), 0} {
  auto *buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!buffer)
    throw std::bad_alloc();

  avio_ctx_ = avio_alloc_context(buffer, AVIO_BUFFER_SIZE, 0, &state_,
                                 &MemoryReader::read, nullptr,
                                 &MemoryReader::seek);
  if (!avio_ctx_) {
    av_free(buffer);
    throw std::bad_alloc();
  }
}

MemoryReader::~MemoryReader() {
  if (avio_ctx_) {
    /// The context may have swapped its buffer; free whatever it holds now
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  }
}

int MemoryReader::read(void *opaque, uint8_t *buf, int buf_size) {
  auto *st = static_cast<State *>(opaque);
  size_t bytes_left = st->size - st->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  std::memcpy(buf, st->ptr + st->pos, copy);
  st->pos += copy;
  return static_cast<int>(copy);
}

int64_t MemoryReader::seek(void *opaque, int64_t offset, int whence) {
  auto *st = static_cast<State *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(st->size);

  int64_t new_pos = static_cast<int64_t>(st->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(st->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  if (new_pos < 0 || new_pos > static_cast<int64_t>(st->size))
    return AVERROR(EINVAL);

  st->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

} // namespace auto_shorts

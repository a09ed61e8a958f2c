#pragma once

#include "error.h"
#include "host.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace libmarc {

class MmapSource;

// Bytes read from a host-owned stream. Reads need the host lock.
class HostStreamSource {
public:
  explicit HostStreamSource(std::shared_ptr<HostStream> stream) : stream_(std::move(stream)) {}

  Result<size_t> read(const HostLockToken& token, uint8_t* buffer, size_t max_bytes) {
    return stream_->read(token, buffer, max_bytes);
  }

private:
  std::shared_ptr<HostStream> stream_;
};

// Bytes read from an OS file through stdio.
class FileSource {
public:
  static Result<FileSource> open(const std::string& path);

  FileSource() = default;

  Result<size_t> read(uint8_t* buffer, size_t max_bytes);
  const std::string& path() const { return path_; }

private:
  struct FileCloser {
    void operator()(std::FILE* fp) const {
      if (fp)
        std::fclose(fp);
    }
  };

  std::unique_ptr<std::FILE, FileCloser> file_;
  std::string path_;
};

// Bytes served from memory: an owned copy, or a mapped file kept alive by
// shared ownership. Also exposes the whole buffer for zero-copy scanning.
class MemorySource {
public:
  MemorySource() = default;
  explicit MemorySource(std::vector<uint8_t> bytes);
  explicit MemorySource(std::string_view bytes);
  static Result<MemorySource> map_file(const std::string& path);

  Result<size_t> read(uint8_t* buffer, size_t max_bytes);

  const uint8_t* data() const { return data_; }
  size_t size() const { return size_; }
  size_t remaining() const { return size_ - position_; }

private:
  std::shared_ptr<const void> owner_;
  const uint8_t* data_ = nullptr;
  size_t size_ = 0;
  size_t position_ = 0;
};

/**
 * @brief Sequential bytes from one of three fixed origins.
 *
 * The origin is fixed when the source is built and reads dispatch on it
 * directly. File and memory sources need no host lock and may be read from
 * any thread. A host stream source must only be read with the host lock
 * held, so its read requires a HostLockToken.
 */
class ByteSource {
public:
  enum class Kind { HOST_STREAM, FILE, MEMORY };

  // Empty memory source
  ByteSource() : impl_(MemorySource{}) {}

  explicit ByteSource(HostStreamSource source) : impl_(std::move(source)) {}
  explicit ByteSource(FileSource source) : impl_(std::move(source)) {}
  explicit ByteSource(MemorySource source) : impl_(std::move(source)) {}

  // Factories report unusable input (missing file, directory, null stream)
  // as a configuration error before any bytes are read.
  static Result<ByteSource> from_path(const std::string& path);
  static Result<ByteSource> from_mapped_path(const std::string& path);
  static ByteSource from_bytes(std::vector<uint8_t> bytes);
  static ByteSource from_bytes(std::string_view bytes);
  static Result<ByteSource> from_host_stream(std::shared_ptr<HostStream> stream);

  Kind kind() const { return static_cast<Kind>(impl_.index()); }
  bool requires_host_lock() const { return kind() == Kind::HOST_STREAM; }

  // Read from a file or memory source. A host stream source fails with an
  // UNSUPPORTED_SOURCE message, since the caller holds no token.
  Result<size_t> read(uint8_t* buffer, size_t max_bytes);

  // Read from any source while holding the host lock.
  Result<size_t> read(const HostLockToken& token, uint8_t* buffer, size_t max_bytes);

  // Total bytes returned by read() so far
  size_t position() const { return position_; }

  // Whole remaining buffer for memory sources, nullptr otherwise
  const MemorySource* memory() const { return std::get_if<MemorySource>(&impl_); }

private:
  std::variant<HostStreamSource, FileSource, MemorySource> impl_;
  size_t position_ = 0;
};

const char* source_kind_name(ByteSource::Kind kind);

} // namespace libmarc

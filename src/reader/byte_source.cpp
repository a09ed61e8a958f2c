#include "libmarc/byte_source.h"
#include "libmarc/mmap_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <type_traits>

namespace libmarc {

// =============================================================================
// FileSource
// =============================================================================

Result<FileSource> FileSource::open(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return Result<FileSource>::failure("Path is a directory: " + path);
  }

  std::FILE* fp = std::fopen(path.c_str(), "rb");
  if (fp == nullptr) {
    return Result<FileSource>::failure("Failed to open file: " + path + ": " +
                                       std::strerror(errno));
  }

  FileSource source;
  source.file_.reset(fp);
  source.path_ = path;
  return Result<FileSource>::success(std::move(source));
}

Result<size_t> FileSource::read(uint8_t* buffer, size_t max_bytes) {
  if (!file_) {
    return Result<size_t>::failure("File source is not open");
  }
  if (max_bytes == 0) {
    return Result<size_t>::success(0);
  }

  size_t n = std::fread(buffer, 1, max_bytes, file_.get());
  if (n < max_bytes && std::ferror(file_.get())) {
    return Result<size_t>::failure("Read error on " + path_ + ": " + std::strerror(errno));
  }
  return Result<size_t>::success(std::move(n));
}

// =============================================================================
// MemorySource
// =============================================================================

MemorySource::MemorySource(std::vector<uint8_t> bytes) {
  auto owned = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  data_ = owned->data();
  size_ = owned->size();
  owner_ = std::move(owned);
}

MemorySource::MemorySource(std::string_view bytes)
    : MemorySource(std::vector<uint8_t>(bytes.begin(), bytes.end())) {}

Result<MemorySource> MemorySource::map_file(const std::string& path) {
  auto mapping = std::make_shared<MmapSource>();
  auto opened = mapping->open(path);
  if (!opened) {
    return Result<MemorySource>::failure(opened.error);
  }

  MemorySource source;
  source.data_ = mapping->data();
  source.size_ = mapping->size();
  source.owner_ = std::move(mapping);
  return Result<MemorySource>::success(std::move(source));
}

Result<size_t> MemorySource::read(uint8_t* buffer, size_t max_bytes) {
  size_t n = std::min(max_bytes, remaining());
  if (n > 0) {
    std::memcpy(buffer, data_ + position_, n);
    position_ += n;
  }
  return Result<size_t>::success(std::move(n));
}

// =============================================================================
// ByteSource
// =============================================================================

Result<ByteSource> ByteSource::from_path(const std::string& path) {
  auto file = FileSource::open(path);
  if (!file) {
    return Result<ByteSource>::failure(file.error);
  }
  return Result<ByteSource>::success(ByteSource(std::move(file.value)));
}

Result<ByteSource> ByteSource::from_mapped_path(const std::string& path) {
  auto mapped = MemorySource::map_file(path);
  if (!mapped) {
    return Result<ByteSource>::failure(mapped.error);
  }
  return Result<ByteSource>::success(ByteSource(std::move(mapped.value)));
}

ByteSource ByteSource::from_bytes(std::vector<uint8_t> bytes) {
  return ByteSource(MemorySource(std::move(bytes)));
}

ByteSource ByteSource::from_bytes(std::string_view bytes) {
  return ByteSource(MemorySource(bytes));
}

Result<ByteSource> ByteSource::from_host_stream(std::shared_ptr<HostStream> stream) {
  if (!stream) {
    return Result<ByteSource>::failure("Host stream is null");
  }
  return Result<ByteSource>::success(ByteSource(HostStreamSource(std::move(stream))));
}

Result<size_t> ByteSource::read(uint8_t* buffer, size_t max_bytes) {
  Result<size_t> result = std::visit(
      [buffer, max_bytes](auto& source) -> Result<size_t> {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, HostStreamSource>) {
          return Result<size_t>::failure(
              "Host stream sources can only be read while holding the host lock");
        } else {
          return source.read(buffer, max_bytes);
        }
      },
      impl_);
  if (result.ok) {
    // Counts past max_bytes never reached the buffer
    result.value = std::min(result.value, max_bytes);
    position_ += result.value;
  }
  return result;
}

Result<size_t> ByteSource::read(const HostLockToken& token, uint8_t* buffer, size_t max_bytes) {
  Result<size_t> result = std::visit(
      [&token, buffer, max_bytes](auto& source) -> Result<size_t> {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, HostStreamSource>) {
          return source.read(token, buffer, max_bytes);
        } else {
          return source.read(buffer, max_bytes);
        }
      },
      impl_);
  if (result.ok) {
    // Counts past max_bytes never reached the buffer
    result.value = std::min(result.value, max_bytes);
    position_ += result.value;
  }
  return result;
}

const char* source_kind_name(ByteSource::Kind kind) {
  switch (kind) {
  case ByteSource::Kind::HOST_STREAM:
    return "host stream";
  case ByteSource::Kind::FILE:
    return "file";
  case ByteSource::Kind::MEMORY:
    return "memory";
  default:
    return "unknown";
  }
}

} // namespace libmarc

#include "libmarc/mmap_source.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace libmarc {

struct MmapSource::Impl {
  int fd = -1;
  const uint8_t* data = nullptr;
  size_t size = 0;

  bool is_open() const { return fd >= 0; }

  void unmap() {
    if (data != nullptr && size > 0) {
      munmap(const_cast<uint8_t*>(data), size);
    }
    data = nullptr;
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
    size = 0;
  }

  Result<bool> map(const std::string& path) {
    fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
      return Result<bool>::failure("Failed to open file: " + path + ": " + std::strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) < 0) {
      unmap();
      return Result<bool>::failure("Failed to stat file: " + path);
    }
    if (S_ISDIR(st.st_mode)) {
      unmap();
      return Result<bool>::failure("Path is a directory: " + path);
    }

    size = static_cast<size_t>(st.st_size);
    if (size == 0) {
      return Result<bool>::success(true);
    }

    void* ptr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (ptr == MAP_FAILED) {
      size = 0;
      unmap();
      return Result<bool>::failure("Failed to mmap file: " + path + ": " + std::strerror(errno));
    }
    data = static_cast<const uint8_t*>(ptr);

    // Records are consumed front to back
    madvise(ptr, size, MADV_SEQUENTIAL);
    return Result<bool>::success(true);
  }
};

MmapSource::MmapSource() : impl_(std::make_unique<Impl>()) {}

MmapSource::~MmapSource() {
  close();
}

MmapSource::MmapSource(MmapSource&& other) noexcept : impl_(std::move(other.impl_)) {
  other.impl_ = std::make_unique<Impl>();
}

MmapSource& MmapSource::operator=(MmapSource&& other) noexcept {
  if (this != &other) {
    close();
    std::swap(impl_, other.impl_);
  }
  return *this;
}

Result<bool> MmapSource::open(const std::string& path) {
  if (impl_->is_open()) {
    close();
  }
  return impl_->map(path);
}

const uint8_t* MmapSource::data() const {
  return impl_->data;
}

size_t MmapSource::size() const {
  return impl_->size;
}

bool MmapSource::is_open() const {
  return impl_->is_open();
}

void MmapSource::close() {
  if (impl_)
    impl_->unmap();
}

} // namespace libmarc

#pragma once

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace libmarc {

// Read-only memory mapping of a whole file.
class MmapSource {
public:
  MmapSource();
  ~MmapSource();

  MmapSource(MmapSource&&) noexcept;
  MmapSource& operator=(MmapSource&&) noexcept;

  MmapSource(const MmapSource&) = delete;
  MmapSource& operator=(const MmapSource&) = delete;

  // Map a file for reading. An empty file opens successfully with size 0.
  Result<bool> open(const std::string& path);

  const uint8_t* data() const;
  size_t size() const;
  std::span<const uint8_t> bytes() const { return {data(), size()}; }

  bool is_open() const;

  void close();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace libmarc

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>

namespace libmarc {

/**
 * @brief Owned copy of one record's raw bytes.
 *
 * Records up to INLINE_CAPACITY bytes are held inline; larger ones spill to a
 * heap allocation. The batched reader copies each record once into a
 * RecordBytes while it holds the host lock, so decoding after the lock is
 * released never reads from a buffer the host may reuse.
 */
class RecordBytes {
public:
  static constexpr size_t INLINE_CAPACITY = 4096;

  RecordBytes() = default;
  RecordBytes(const uint8_t* data, size_t size) { assign(data, size); }

  RecordBytes(RecordBytes&& other) noexcept { move_from(other); }

  RecordBytes& operator=(RecordBytes&& other) noexcept {
    if (this != &other) {
      move_from(other);
    }
    return *this;
  }

  // Non-copyable
  RecordBytes(const RecordBytes&) = delete;
  RecordBytes& operator=(const RecordBytes&) = delete;

  void assign(const uint8_t* data, size_t size) {
    if (size > INLINE_CAPACITY) {
      heap_ = std::make_unique<uint8_t[]>(size);
      std::memcpy(heap_.get(), data, size);
    } else {
      heap_.reset();
      if (size > 0)
        std::memcpy(inline_.data(), data, size);
    }
    size_ = size;
  }

  const uint8_t* data() const { return heap_ ? heap_.get() : inline_.data(); }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  bool is_inline() const { return !heap_; }

private:
  void move_from(RecordBytes& other) {
    size_ = other.size_;
    heap_ = std::move(other.heap_);
    if (!heap_ && size_ > 0) {
      std::memcpy(inline_.data(), other.inline_.data(), size_);
    }
    other.size_ = 0;
  }

  std::array<uint8_t, INLINE_CAPACITY> inline_;
  std::unique_ptr<uint8_t[]> heap_;
  size_t size_ = 0;
};

} // namespace libmarc

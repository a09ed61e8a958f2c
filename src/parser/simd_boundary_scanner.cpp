// SIMD record boundary scanner using Google Highway.
//
// This file uses Highway's dynamic dispatch to select the optimal
// SIMD implementation at runtime based on CPU capabilities.
// The core loop processes 64 bytes at a time:
// 1. Load and compare each vector against the record terminator
// 2. Pack the comparison masks into one 64-bit word
// 3. Walk the set bits to emit (offset, length) spans

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "src/parser/simd_boundary_scanner.cpp"
#include "libmarc/types.h"

#include "hwy/foreach_target.h"
#include "hwy/highway.h"

#include <cstdint>
#include <vector>

HWY_BEFORE_NAMESPACE();
namespace libmarc {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// Bitmask of terminator positions in data[0..64)
HWY_INLINE uint64_t TerminatorBits64(const uint8_t* data) {
  // Capped so one vector never spans more than a 64-byte block
  const hn::CappedTag<uint8_t, 64> d;
  const size_t N = hn::Lanes(d);
  const auto term_vec = hn::Set(d, RECORD_TERMINATOR);

  uint64_t bits = 0;
  for (size_t chunk_offset = 0; chunk_offset < 64; chunk_offset += N) {
    auto block = hn::LoadU(d, data + chunk_offset);
    auto tm = hn::Eq(block, term_vec);

    uint8_t t_bytes[HWY_MAX_BYTES / 8] = {0};
    hn::StoreMaskBits(d, tm, t_bytes);

    const size_t num_mask_bytes = (N + 7) / 8;
    for (size_t b = 0; b < num_mask_bytes && chunk_offset + b * 8 < 64; ++b) {
      bits |= static_cast<uint64_t>(t_bytes[b]) << (chunk_offset + b * 8);
    }
  }
  return bits;
}

// Appends up to max_count spans to out. Returns the number appended.
HWY_NOINLINE size_t ScanTerminatorsSimdImpl(const uint8_t* data, size_t size, size_t max_count,
                                            std::vector<RecordBoundary>* out) {
  size_t found = 0;
  size_t record_start = 0;
  size_t offset = 0;

  while (offset + 64 <= size && found < max_count) {
    uint64_t bits = TerminatorBits64(data + offset);
    while (bits != 0 && found < max_count) {
      size_t pos = offset + static_cast<size_t>(__builtin_ctzll(bits));
      out->push_back({record_start, pos + 1 - record_start});
      record_start = pos + 1;
      ++found;
      bits &= bits - 1;
    }
    offset += 64;
  }

  // Handle remaining bytes with scalar code
  while (offset < size && found < max_count) {
    if (data[offset] == RECORD_TERMINATOR) {
      out->push_back({record_start, offset + 1 - record_start});
      record_start = offset + 1;
      ++found;
    }
    ++offset;
  }

  return found;
}

HWY_NOINLINE size_t CountTerminatorsSimdImpl(const uint8_t* data, size_t size) {
  size_t count = 0;
  size_t offset = 0;
  while (offset + 64 <= size) {
    count += static_cast<size_t>(__builtin_popcountll(TerminatorBits64(data + offset)));
    offset += 64;
  }
  for (; offset < size; ++offset) {
    if (data[offset] == RECORD_TERMINATOR)
      ++count;
  }
  return count;
}

} // namespace HWY_NAMESPACE
} // namespace libmarc
HWY_AFTER_NAMESPACE();

#if HWY_ONCE

#include "libmarc/boundary_scanner.h"

namespace libmarc {

// Export implementations for dynamic dispatch
HWY_EXPORT(ScanTerminatorsSimdImpl);
HWY_EXPORT(CountTerminatorsSimdImpl);

size_t scan_boundaries_into(const uint8_t* data, size_t size, size_t max_count,
                            std::vector<RecordBoundary>& out) {
  if (size == 0 || max_count == 0)
    return 0;
  return HWY_DYNAMIC_DISPATCH(ScanTerminatorsSimdImpl)(data, size, max_count, &out);
}

std::vector<RecordBoundary> scan_boundaries(const uint8_t* data, size_t size) {
  std::vector<RecordBoundary> out;
  scan_boundaries_into(data, size, static_cast<size_t>(-1), out);
  return out;
}

std::vector<RecordBoundary> scan_boundaries_limited(const uint8_t* data, size_t size,
                                                    size_t max_count) {
  std::vector<RecordBoundary> out;
  scan_boundaries_into(data, size, max_count, out);
  return out;
}

size_t count_records(const uint8_t* data, size_t size) {
  if (size == 0)
    return 0;
  return HWY_DYNAMIC_DISPATCH(CountTerminatorsSimdImpl)(data, size);
}

std::vector<RecordBoundary> scan_boundaries_scalar(const uint8_t* data, size_t size,
                                                   size_t max_count) {
  std::vector<RecordBoundary> out;
  size_t record_start = 0;
  for (size_t i = 0; i < size && out.size() < max_count; ++i) {
    if (data[i] == RECORD_TERMINATOR) {
      out.push_back({record_start, i + 1 - record_start});
      record_start = i + 1;
    }
  }
  return out;
}

size_t count_records_scalar(const uint8_t* data, size_t size) {
  size_t count = 0;
  for (size_t i = 0; i < size; ++i) {
    if (data[i] == RECORD_TERMINATOR)
      ++count;
  }
  return count;
}

} // namespace libmarc

#endif // HWY_ONCE

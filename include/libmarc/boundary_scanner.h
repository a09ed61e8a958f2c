#pragma once

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace libmarc {

// Record boundary detection.
//
// Each record terminator (0x1D) closes the record that began just after the
// previous terminator, or at the start of the buffer. Trailing bytes with no
// terminator are not reported; callers carry them into the next buffer.
// Results depend only on byte content, so any split of a stream into buffers
// yields the same boundaries once offsets are rebased.
//
// The SIMD variants use Highway dynamic dispatch and process 64 bytes per
// step; the scalar variants exist for verification and fuzzing.

// All complete records in [data, data + size)
std::vector<RecordBoundary> scan_boundaries(const uint8_t* data, size_t size);

// At most max_count records from the start of the buffer
std::vector<RecordBoundary> scan_boundaries_limited(const uint8_t* data, size_t size,
                                                    size_t max_count);

// Appends up to max_count boundaries to out (reusing its capacity).
// Returns the number appended.
size_t scan_boundaries_into(const uint8_t* data, size_t size, size_t max_count,
                            std::vector<RecordBoundary>& out);

// Number of record terminators in the buffer
size_t count_records(const uint8_t* data, size_t size);

// Scalar fallback for small data or verification
std::vector<RecordBoundary> scan_boundaries_scalar(const uint8_t* data, size_t size,
                                                   size_t max_count = static_cast<size_t>(-1));
size_t count_records_scalar(const uint8_t* data, size_t size);

} // namespace libmarc

#pragma once

#include "options.h"
#include "record_bytes.h"
#include "record_decoder.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace libmarc {

/**
 * @brief Worker pool that decodes record spans in parallel.
 *
 * Each call partitions its records into contiguous slices, one pool task per
 * slice, and assembles results in input order: results[i] always belongs to
 * the i-th span, whichever worker decoded it. An exception escaping the
 * decoder becomes an INTERNAL_ERROR result for that record; the pool and the
 * rest of the batch are unaffected.
 *
 * Small batches are decoded on the calling thread.
 */
class DecodePool {
public:
  explicit DecodePool(const ThreadOptions& threads = {}, const DecodeOptions& decode = {});
  ~DecodePool();

  DecodePool(const DecodePool&) = delete;
  DecodePool& operator=(const DecodePool&) = delete;

  size_t num_threads() const;
  const DecodeOptions& decode_options() const;

  /// Decode spans of a shared buffer. base_offset is the stream position of
  /// data[0]. A span that does not lie inside [data, data + size) yields an
  /// INTERNAL_ERROR result.
  std::vector<DecodeResult> decode_batch(const std::vector<RecordBoundary>& boundaries,
                                         const uint8_t* data, size_t size, size_t base_offset = 0);

  /// Decode owned record copies. offsets[i] is the stream position of
  /// records[i].
  std::vector<DecodeResult> decode_owned(const std::vector<RecordBytes>& records,
                                         const std::vector<size_t>& offsets);

  using DecodeTask = std::function<DecodeResult(size_t index)>;

  /// Run task for every index in [0, n) on the pool, in input order. An
  /// exception from task(i) becomes an INTERNAL_ERROR with record_index i.
  std::vector<DecodeResult> map_indexed(size_t n, const DecodeTask& task);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace libmarc

#pragma once

#include "byte_source.h"
#include "error.h"
#include "host.h"
#include "options.h"
#include "record_decoder.h"
#include "stream_item.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libmarc {

/// Records read by one next_batch() call.
struct RecordBatch {
  /// Per-record results in stream order
  std::vector<DecodeResult> results;
  /// Set on the batch where the stream failed. It follows the results of
  /// every record completed before the failure.
  std::optional<StreamError> stream_error;

  bool empty() const { return results.empty() && !stream_error; }
  size_t size() const { return results.size(); }
  size_t record_count() const;
  size_t error_count() const;

  std::vector<Record> take_records();
  std::vector<ParseError> parse_errors() const;
};

/**
 * @brief Reads records in bounded batches, cooperating with the host lock.
 *
 * Each next_batch() call works in two steps:
 * - Read raw records from the source until the record or byte limit is
 *   reached or the source is exhausted. For host streams this happens while
 *   the caller holds the host lock; every record is copied once into an
 *   owned buffer.
 * - Decode the copies with the host lock released (HostUnlock), so other
 *   host threads can run. Nothing in this step calls into the host.
 *
 * State machine: INITIAL -> READING -> END_OF_STREAM. END_OF_STREAM is
 * terminal: later calls return an empty batch without touching the source.
 *
 * Batches are capped at ReaderOptions::max_batch_records records and
 * max_batch_bytes bytes whatever the caller requests. Hitting a cap simply
 * ends the batch. Bytes without a terminator are dropped in
 * MAX_RECORD_LENGTH runs (see unterminated_run_error()), so one call reads
 * at most max_bytes + read_size + MAX_RECORD_LENGTH bytes.
 *
 * @note A reader is bound to the thread that uses it. It can be moved to
 * another thread but never copied or shared.
 */
class BatchedReader {
public:
  // END_OF_STREAM rather than EOF, which <cstdio> defines as a macro
  enum class State { INITIAL, READING, END_OF_STREAM };

  explicit BatchedReader(const ReaderOptions& options = {});
  ~BatchedReader();

  BatchedReader(BatchedReader&&) noexcept;
  BatchedReader& operator=(BatchedReader&&) noexcept;

  BatchedReader(const BatchedReader&) = delete;
  BatchedReader& operator=(const BatchedReader&) = delete;

  // Open a file
  Result<bool> open(const std::string& path);

  // Open from an in-memory copy of the bytes
  Result<bool> open_from_buffer(std::vector<uint8_t> bytes);
  Result<bool> open_from_buffer(std::string_view bytes);

  // Open a host-owned stream. Reads then need the token overloads.
  Result<bool> open_host_stream(std::shared_ptr<HostStream> stream);

  Result<bool> open_source(ByteSource source);

  // Host-lock overloads accept every source kind.
  RecordBatch next_batch(const HostLockToken& token);
  RecordBatch next_batch(const HostLockToken& token, size_t max_records, size_t max_bytes);

  // For file and memory sources. A host stream source yields a single
  // UNSUPPORTED_SOURCE stream error.
  RecordBatch next_batch();
  RecordBatch next_batch(size_t max_records, size_t max_bytes);

  // One item at a time, refilled from batches of ReaderOptions::batch_size.
  StreamItem next(const HostLockToken& token);
  StreamItem next();

  State state() const;
  bool is_eof() const { return state() == State::END_OF_STREAM; }

  size_t records_read() const;
  size_t bytes_consumed() const;
  const ErrorCollector& errors() const;
  const ReaderOptions& options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

const char* reader_state_name(BatchedReader::State state);

} // namespace libmarc

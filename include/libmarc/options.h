#pragma once

#include "error.h"

#include <cstddef>

namespace libmarc {

// How the decoder treats structural damage inside a record.
// FAIL_FAST (not STRICT, which collides with a Windows macro) rejects the
// record on the first malformed directory entry or field. LENIENT drops the
// malformed entry and keeps the rest. Framing, leader and terminator faults
// reject the record in both modes.
enum class RecoveryMode { FAIL_FAST, LENIENT };

struct DecodeOptions {
  RecoveryMode recovery = RecoveryMode::FAIL_FAST;
  bool validate_utf8 = true; // Only applies to records with leader position 9 = 'a'
};

// Decode pool sizing
struct ThreadOptions {
  size_t num_threads = 0; // 0 = LIBMARC_NUM_THREADS if set, else hardware_concurrency

  static constexpr const char* ENV_NUM_THREADS = "LIBMARC_NUM_THREADS";

  // Records per pool task; small batches are decoded inline
  static constexpr size_t MIN_RECORDS_PER_TASK = 16;
};

// Options for the batched reader used with host streams
struct ReaderOptions {
  size_t batch_size = 100; // Records requested by next_batch() when not given

  // Ceilings applied to every batch regardless of what the caller asks for
  static constexpr size_t MAX_BATCH_RECORDS = 200;
  static constexpr size_t MAX_BATCH_BYTES = 300 * 1024;

  size_t max_batch_records = MAX_BATCH_RECORDS;
  size_t max_batch_bytes = MAX_BATCH_BYTES;

  size_t read_size = 64 * 1024; // Bytes requested from the source per read
  size_t max_errors = ErrorCollector::DEFAULT_MAX_ERRORS;

  ThreadOptions threads;
  DecodeOptions decode;
};

// Options for the producer-consumer pipeline used with files and buffers
struct PipelineOptions {
  size_t chunk_size = 512 * 1024;
  size_t channel_capacity = 1000;
  size_t max_errors = ErrorCollector::DEFAULT_MAX_ERRORS;

  ThreadOptions threads;
  DecodeOptions decode;
};

// Resolve the decode pool size: explicit value, then LIBMARC_NUM_THREADS,
// then hardware_concurrency (4 if that reports 0).
size_t resolve_num_threads(const ThreadOptions& options);

} // namespace libmarc

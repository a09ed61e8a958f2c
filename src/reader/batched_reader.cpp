#include "libmarc/batched_reader.h"
#include "libmarc/boundary_scanner.h"
#include "libmarc/decode_pool.h"
#include "libmarc/record_bytes.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace libmarc {

// =============================================================================
// RecordBatch
// =============================================================================

size_t RecordBatch::record_count() const {
  return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                           [](const DecodeResult& r) { return is_record(r); }));
}

size_t RecordBatch::error_count() const {
  return results.size() - record_count();
}

std::vector<Record> RecordBatch::take_records() {
  std::vector<Record> records;
  records.reserve(results.size());
  for (auto& result : results) {
    if (auto* record = std::get_if<Record>(&result))
      records.push_back(std::move(*record));
  }
  return records;
}

std::vector<ParseError> RecordBatch::parse_errors() const {
  std::vector<ParseError> errors;
  for (const auto& result : results) {
    if (const auto* error = std::get_if<ParseError>(&result))
      errors.push_back(*error);
  }
  return errors;
}

// =============================================================================
// BatchedReader::Impl
// =============================================================================

namespace {

bool is_padding(uint8_t c) {
  return c == '\n' || c == '\r' || c == ' ' || c == '\t' || c == '\0';
}

} // namespace

struct BatchedReader::Impl {
  ReaderOptions options;
  ErrorCollector errors;
  std::unique_ptr<DecodePool> pool;
  std::optional<ByteSource> source;
  State state = State::INITIAL;

  // Unconsumed bytes are buffer[buffer_pos, buffer.size())
  std::vector<uint8_t> buffer;
  size_t buffer_pos = 0;
  size_t buffer_stream_offset = 0; // Stream position of buffer[0]
  bool source_exhausted = false;
  std::optional<StreamError> pending_error;

  std::vector<RecordBoundary> scratch;
  std::deque<StreamItem> pending_items;

  size_t records_read = 0;
  size_t next_record_index = 0;

  // Raw records gathered while the source is being read. Unterminated runs
  // hold an empty placeholder in records; runs lists their positions.
  struct RawBatch {
    std::vector<RecordBytes> records;
    std::vector<size_t> offsets;
    std::vector<size_t> runs;
  };

  explicit Impl(const ReaderOptions& opts)
      : options(opts), errors(opts.max_errors),
        pool(std::make_unique<DecodePool>(opts.threads, opts.decode)) {}

  Result<bool> reset(ByteSource src) {
    source.emplace(std::move(src));
    state = State::INITIAL;
    buffer.clear();
    buffer_pos = 0;
    buffer_stream_offset = 0;
    source_exhausted = false;
    pending_error.reset();
    pending_items.clear();
    errors.clear();
    records_read = 0;
    next_record_index = 0;
    SPDLOG_DEBUG("Batched reader opened {} source", source_kind_name(source->kind()));
    return Result<bool>::success(true);
  }

  size_t stream_position() const { return buffer_stream_offset + buffer_pos; }

  static bool batch_full(const RawBatch& raw, size_t batch_bytes, size_t next_bytes,
                         size_t limit_records, size_t limit_bytes) {
    // The first item is always taken, whatever its size
    return !raw.records.empty() &&
           (raw.records.size() >= limit_records || batch_bytes + next_bytes > limit_bytes);
  }

  // Drops MAX_RECORD_LENGTH bytes at buffer_pos, which hold no terminator.
  void take_run(RawBatch& raw, size_t& batch_bytes) {
    raw.records.emplace_back();
    raw.offsets.push_back(buffer_stream_offset + buffer_pos);
    raw.runs.push_back(raw.records.size() - 1);
    batch_bytes += MAX_RECORD_LENGTH;
    buffer_pos += MAX_RECORD_LENGTH;
  }

  // Move complete records from the buffer into raw, stopping at either limit.
  // Spans and unterminated bytes longer than MAX_RECORD_LENGTH lose runs of
  // MAX_RECORD_LENGTH bytes from the front, so the buffer never holds more
  // than one maximum record plus one read. Returns true when a limit was
  // reached.
  bool take_buffered(RawBatch& raw, size_t& batch_bytes, size_t limit_records, size_t limit_bytes) {
    if (raw.records.size() >= limit_records)
      return true;
    const size_t base = buffer_pos;
    const size_t avail = buffer.size() - base;
    if (avail == 0)
      return false;

    scratch.clear();
    scan_boundaries_into(buffer.data() + base, avail, limit_records - raw.records.size(), scratch);
    for (const auto& b : scratch) {
      // Boundaries are contiguous, so buffer_pos == base + b.offset here
      size_t length = b.length;
      while (length > MAX_RECORD_LENGTH) {
        if (batch_full(raw, batch_bytes, MAX_RECORD_LENGTH, limit_records, limit_bytes))
          return true;
        take_run(raw, batch_bytes);
        length -= MAX_RECORD_LENGTH;
      }
      if (batch_full(raw, batch_bytes, length, limit_records, limit_bytes))
        return true;
      raw.records.emplace_back(buffer.data() + buffer_pos, length);
      raw.offsets.push_back(buffer_stream_offset + buffer_pos);
      batch_bytes += length;
      buffer_pos += length;
    }

    while (buffer.size() - buffer_pos > MAX_RECORD_LENGTH) {
      if (batch_full(raw, batch_bytes, MAX_RECORD_LENGTH, limit_records, limit_bytes))
        return true;
      take_run(raw, batch_bytes);
    }
    return raw.records.size() >= limit_records || batch_bytes >= limit_bytes;
  }

  // Reads one block from the source after the unconsumed bytes.
  template <typename ReadFn> void read_more(ReadFn& read_fn) {
    if (buffer_pos > 0) {
      buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(buffer_pos));
      buffer_stream_offset += buffer_pos;
      buffer_pos = 0;
    }

    const size_t old_size = buffer.size();
    const size_t want = std::max<size_t>(options.read_size, 1);
    buffer.resize(old_size + want);
    Result<size_t> got = read_fn(buffer.data() + old_size, want);
    buffer.resize(old_size + (got.ok ? std::min(got.value, want) : 0));

    if (!got.ok) {
      // Completed records were already taken; the rest belongs to the error
      pending_error = StreamError{ErrorCode::IO_ERROR, buffer_stream_offset + old_size, got.error};
      source_exhausted = true;
      buffer.clear();
      buffer_pos = 0;
      return;
    }
    if (got.value == 0) {
      source_exhausted = true;
    }
  }

  // Bytes left after the last terminator once the source is exhausted.
  void take_tail(RawBatch& raw) {
    const size_t avail = buffer.size() - buffer_pos;
    if (avail == 0)
      return;

    const uint8_t* tail = buffer.data() + buffer_pos;
    const size_t tail_offset = stream_position();
    if (std::all_of(tail, tail + avail, is_padding)) {
      SPDLOG_DEBUG("Ignoring {} trailing padding byte(s) at offset {}", avail, tail_offset);
    } else if (avail < LENGTH_HEADER_DIGITS) {
      pending_error = StreamError{ErrorCode::UNEXPECTED_END_OF_STREAM, tail_offset,
                                  "Stream ended inside a record length header (" +
                                      std::to_string(avail) + " byte(s))"};
    } else {
      // Decodes to TRUNCATED_RECORD or MISSING_TERMINATOR
      raw.records.emplace_back(tail, avail);
      raw.offsets.push_back(tail_offset);
    }
    buffer.clear();
    buffer_pos = 0;
    buffer_stream_offset = tail_offset + avail;
  }

  template <typename ReadFn>
  RawBatch collect(ReadFn&& read_fn, size_t max_records, size_t max_bytes) {
    const size_t limit_records =
        std::min(std::max<size_t>(max_records, 1), std::max<size_t>(options.max_batch_records, 1));
    const size_t limit_bytes =
        std::min(std::max<size_t>(max_bytes, 1), std::max<size_t>(options.max_batch_bytes, 1));

    if (state == State::INITIAL)
      state = State::READING;

    RawBatch raw;
    size_t batch_bytes = 0;
    while (!take_buffered(raw, batch_bytes, limit_records, limit_bytes)) {
      if (source_exhausted) {
        take_tail(raw);
        break;
      }
      read_more(read_fn);
      if (pending_error)
        break;
    }
    return raw;
  }

  // Runs were never decoded; their placeholders become run errors.
  static void mark_runs(std::vector<DecodeResult>& results, const RawBatch& raw) {
    for (size_t i : raw.runs) {
      results[i] = unterminated_run_error(raw.offsets[i]);
    }
  }

  // Tags results with stream-wide indices, records errors, and applies the
  // state transition for this batch.
  RecordBatch finish(std::vector<DecodeResult>&& results) {
    RecordBatch batch;
    batch.results = std::move(results);
    for (auto& result : batch.results) {
      size_t index = next_record_index++;
      if (auto* error = std::get_if<ParseError>(&result)) {
        error->record_index = index;
        errors.add_error(*error);
      } else {
        ++records_read;
      }
    }

    if (pending_error) {
      SPDLOG_WARN("Batched reader stopped: {}", pending_error->to_string());
      batch.stream_error = std::move(pending_error);
      pending_error.reset();
      state = State::END_OF_STREAM;
    } else if (batch.results.empty() && source_exhausted) {
      SPDLOG_DEBUG("Batched reader reached end of stream after {} record(s)", next_record_index);
      state = State::END_OF_STREAM;
    }
    return batch;
  }

  void refill(RecordBatch&& batch) {
    for (auto& result : batch.results) {
      pending_items.push_back(StreamItem::from(std::move(result)));
    }
    if (batch.stream_error) {
      pending_items.emplace_back(std::move(*batch.stream_error));
    }
  }

  StreamItem pop_item() {
    if (pending_items.empty())
      return StreamItem::exhausted();
    StreamItem item = std::move(pending_items.front());
    pending_items.pop_front();
    return item;
  }
};

// =============================================================================
// BatchedReader
// =============================================================================

BatchedReader::BatchedReader(const ReaderOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

BatchedReader::~BatchedReader() = default;

BatchedReader::BatchedReader(BatchedReader&&) noexcept = default;
BatchedReader& BatchedReader::operator=(BatchedReader&&) noexcept = default;

Result<bool> BatchedReader::open(const std::string& path) {
  auto source = ByteSource::from_path(path);
  if (!source) {
    return Result<bool>::failure(source.error);
  }
  return impl_->reset(std::move(source.value));
}

Result<bool> BatchedReader::open_from_buffer(std::vector<uint8_t> bytes) {
  return impl_->reset(ByteSource::from_bytes(std::move(bytes)));
}

Result<bool> BatchedReader::open_from_buffer(std::string_view bytes) {
  return impl_->reset(ByteSource::from_bytes(bytes));
}

Result<bool> BatchedReader::open_host_stream(std::shared_ptr<HostStream> stream) {
  auto source = ByteSource::from_host_stream(std::move(stream));
  if (!source) {
    return Result<bool>::failure(source.error);
  }
  return impl_->reset(std::move(source.value));
}

Result<bool> BatchedReader::open_source(ByteSource source) {
  return impl_->reset(std::move(source));
}

RecordBatch BatchedReader::next_batch(const HostLockToken& token) {
  return next_batch(token, impl_->options.batch_size, impl_->options.max_batch_bytes);
}

RecordBatch BatchedReader::next_batch(const HostLockToken& token, size_t max_records,
                                      size_t max_bytes) {
  if (impl_->state == State::END_OF_STREAM || !impl_->source) {
    return {};
  }

  // Phase 1: host lock held
  ByteSource& source = *impl_->source;
  auto raw = impl_->collect(
      [&source, &token](uint8_t* buf, size_t n) { return source.read(token, buf, n); },
      max_records, max_bytes);

  // Phase 2: host lock released; only owned bytes are touched
  std::vector<DecodeResult> results;
  if (!raw.records.empty()) {
    DecodePool& pool = *impl_->pool;
    results = without_host_lock(token, [&pool, &raw] {
      return pool.decode_owned(raw.records, raw.offsets);
    });
    Impl::mark_runs(results, raw);
  }
  return impl_->finish(std::move(results));
}

RecordBatch BatchedReader::next_batch() {
  return next_batch(impl_->options.batch_size, impl_->options.max_batch_bytes);
}

RecordBatch BatchedReader::next_batch(size_t max_records, size_t max_bytes) {
  if (impl_->state == State::END_OF_STREAM || !impl_->source) {
    return {};
  }

  if (impl_->source->requires_host_lock()) {
    impl_->pending_error = StreamError{ErrorCode::UNSUPPORTED_SOURCE, impl_->stream_position(),
                                       "Host stream sources must be read with a host lock token"};
    return impl_->finish({});
  }

  ByteSource& source = *impl_->source;
  auto raw = impl_->collect([&source](uint8_t* buf, size_t n) { return source.read(buf, n); },
                            max_records, max_bytes);

  std::vector<DecodeResult> results;
  if (!raw.records.empty()) {
    results = impl_->pool->decode_owned(raw.records, raw.offsets);
    Impl::mark_runs(results, raw);
  }
  return impl_->finish(std::move(results));
}

StreamItem BatchedReader::next(const HostLockToken& token) {
  while (impl_->pending_items.empty() && !is_eof() && impl_->source) {
    impl_->refill(next_batch(token));
  }
  return impl_->pop_item();
}

StreamItem BatchedReader::next() {
  while (impl_->pending_items.empty() && !is_eof() && impl_->source) {
    impl_->refill(next_batch());
  }
  return impl_->pop_item();
}

BatchedReader::State BatchedReader::state() const {
  return impl_->state;
}

size_t BatchedReader::records_read() const {
  return impl_->records_read;
}

size_t BatchedReader::bytes_consumed() const {
  return impl_->stream_position();
}

const ErrorCollector& BatchedReader::errors() const {
  return impl_->errors;
}

const ReaderOptions& BatchedReader::options() const {
  return impl_->options;
}

const char* reader_state_name(BatchedReader::State state) {
  switch (state) {
  case BatchedReader::State::INITIAL:
    return "INITIAL";
  case BatchedReader::State::READING:
    return "READING";
  case BatchedReader::State::END_OF_STREAM:
    return "END_OF_STREAM";
  default:
    return "UNKNOWN";
  }
}

} // namespace libmarc

#include "libmarc/pipeline.h"
#include "libmarc/boundary_scanner.h"
#include "libmarc/decode_pool.h"
#include "libmarc/record_channel.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace libmarc {

namespace {

bool is_padding(uint8_t c) {
  return c == '\n' || c == '\r' || c == ' ' || c == '\t' || c == '\0';
}

} // namespace

struct Pipeline::Impl {
  PipelineOptions options;
  ErrorCollector errors;
  std::optional<ByteSource> source;
  std::unique_ptr<DecodePool> pool;
  std::unique_ptr<RecordChannel<StreamItem>> channel;
  std::thread producer;

  std::atomic<bool> started{false};
  std::atomic<bool> finished{false};
  std::atomic<size_t> records_delivered{0};

  explicit Impl(const PipelineOptions& opts) : options(opts), errors(opts.max_errors) {}

  ~Impl() {
    // 1. Cancel the channel so a producer blocked on push() wakes up
    // 2. Join the producer before the pool and source are destroyed
    shutdown();
  }

  void shutdown() {
    if (channel) {
      channel->cancel();
    }
    if (producer.joinable()) {
      producer.join();
    }
    finished = true;
  }

  Result<bool> set_source(ByteSource src) {
    if (started) {
      return Result<bool>::failure("Pipeline already started");
    }
    if (src.requires_host_lock()) {
      SPDLOG_WARN("Pipeline rejected a host stream source");
      return Result<bool>::failure(
          std::string(error_code_to_string(ErrorCode::UNSUPPORTED_SOURCE)) +
          ": host stream sources cannot be read by a background producer; use BatchedReader");
    }
    source.emplace(std::move(src));
    return Result<bool>::success(true);
  }

  Result<bool> start() {
    if (started) {
      return Result<bool>::success(true);
    }
    if (!source) {
      return Result<bool>::failure("Pipeline has no source; call open() first");
    }

    pool = std::make_unique<DecodePool>(options.threads, options.decode);
    channel = std::make_unique<RecordChannel<StreamItem>>(options.channel_capacity);
    started = true;
    SPDLOG_INFO("Pipeline producer starting: {} source, chunk {} bytes, capacity {}, {} thread(s)",
                source_kind_name(source->kind()), options.chunk_size, channel->capacity(),
                pool->num_threads());
    producer = std::thread([this] { produce(); });
    return Result<bool>::success(true);
  }

  void produce() {
    try {
      run_producer();
    } catch (const std::exception& e) {
      SPDLOG_WARN("Pipeline producer failed: {}", e.what());
      channel->close_with_error(
          StreamError{ErrorCode::INTERNAL_ERROR, source->position(), e.what()});
    }
  }

  // Returns false once the consumer side is gone.
  bool push_results(std::vector<DecodeResult>& results, size_t& record_index) {
    for (auto& result : results) {
      if (auto* error = std::get_if<ParseError>(&result)) {
        error->record_index = record_index;
      }
      ++record_index;
      if (!channel->push(StreamItem::from(std::move(result)))) {
        return false;
      }
    }
    return true;
  }

  // Cuts MAX_RECORD_LENGTH-byte runs off the front of over-long spans and
  // off unterminated bytes at the end of the chunk, so the carry never
  // exceeds one maximum record. Runs are left as empty spans and listed in
  // runs. Returns the number of chunk bytes the spans cover.
  static size_t split_runs(std::vector<RecordBoundary>& boundaries, size_t chunk_size,
                           std::vector<size_t>& runs) {
    runs.clear();
    const size_t covered = boundaries.empty() ? 0 : boundaries.back().end();
    if (chunk_size - covered <= MAX_RECORD_LENGTH &&
        std::none_of(boundaries.begin(), boundaries.end(),
                     [](const RecordBoundary& b) { return b.length > MAX_RECORD_LENGTH; })) {
      return covered;
    }

    std::vector<RecordBoundary> spans;
    size_t pos = 0;
    for (const auto& b : boundaries) {
      size_t length = b.length;
      while (length > MAX_RECORD_LENGTH) {
        runs.push_back(spans.size());
        spans.push_back({pos, 0});
        pos += MAX_RECORD_LENGTH;
        length -= MAX_RECORD_LENGTH;
      }
      spans.push_back({pos, length});
      pos += length;
    }
    while (chunk_size - pos > MAX_RECORD_LENGTH) {
      runs.push_back(spans.size());
      spans.push_back({pos, 0});
      pos += MAX_RECORD_LENGTH;
    }
    boundaries.swap(spans);
    return pos;
  }

  void run_producer() {
    const size_t chunk_size = std::max<size_t>(options.chunk_size, 1);
    std::vector<uint8_t> chunk; // Carried-over bytes, then the new read
    std::vector<RecordBoundary> boundaries;
    std::vector<size_t> runs;
    size_t chunk_stream_offset = 0;
    size_t record_index = 0;

    while (true) {
      if (channel->is_cancelled()) {
        SPDLOG_DEBUG("Pipeline producer cancelled at offset {}", chunk_stream_offset);
        return;
      }

      const size_t carry = chunk.size();
      chunk.resize(carry + chunk_size);
      Result<size_t> got = source->read(chunk.data() + carry, chunk_size);
      if (!got.ok) {
        // Records before the carried-over bytes were already delivered
        chunk.resize(carry);
        SPDLOG_WARN("Pipeline read failed at offset {}: {}", chunk_stream_offset + carry, got.error);
        channel->close_with_error(
            StreamError{ErrorCode::IO_ERROR, chunk_stream_offset + carry, got.error});
        return;
      }
      chunk.resize(carry + std::min(got.value, chunk_size));

      if (got.value == 0) {
        finish_tail(chunk, chunk_stream_offset, record_index);
        return;
      }

      boundaries.clear();
      scan_boundaries_into(chunk.data(), chunk.size(), static_cast<size_t>(-1), boundaries);
      const size_t consumed = split_runs(boundaries, chunk.size(), runs);
      if (boundaries.empty()) {
        continue;
      }

      // The chunk is read-only until decode_batch returns
      auto results = pool->decode_batch(boundaries, chunk.data(), consumed, chunk_stream_offset);
      for (size_t i : runs) {
        results[i] = unterminated_run_error(chunk_stream_offset + boundaries[i].offset);
      }
      if (!push_results(results, record_index)) {
        SPDLOG_DEBUG("Pipeline producer stopped: channel cancelled");
        return;
      }

      chunk.erase(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(consumed));
      chunk_stream_offset += consumed;
    }
  }

  // End of stream: whatever follows the last terminator is reported, then
  // the channel closes.
  void finish_tail(const std::vector<uint8_t>& tail, size_t tail_offset, size_t& record_index) {
    if (tail.empty() || std::all_of(tail.begin(), tail.end(), is_padding)) {
      SPDLOG_DEBUG("Pipeline producer finished after {} record(s)", record_index);
      channel->close();
      return;
    }

    if (tail.size() < LENGTH_HEADER_DIGITS) {
      channel->close_with_error(StreamError{ErrorCode::UNEXPECTED_END_OF_STREAM, tail_offset,
                                            "Stream ended inside a record length header (" +
                                                std::to_string(tail.size()) + " byte(s))"});
      return;
    }

    // No terminator follows, so this decodes to a per-record error
    std::vector<DecodeResult> results;
    results.push_back(decode_record(tail.data(), tail.size(), options.decode, tail_offset));
    if (push_results(results, record_index)) {
      channel->close();
    }
  }

  // Converts a channel outcome into what the consumer sees.
  StreamItem deliver(StreamItem&& item) {
    if (item.is_record()) {
      ++records_delivered;
    } else if (item.is_parse_error()) {
      errors.add_error(item.parse_error());
    }
    return std::move(item);
  }

  StreamItem finish_consumer() {
    if (!finished.exchange(true)) {
      if (auto error = channel->take_error()) {
        SPDLOG_WARN("Pipeline stream error: {}", error->to_string());
        return StreamItem(std::move(*error));
      }
    }
    return StreamItem::exhausted();
  }
};

Pipeline::Pipeline(const PipelineOptions& options) : impl_(std::make_unique<Impl>(options)) {}

Pipeline::~Pipeline() = default;

Result<bool> Pipeline::open(const std::string& path) {
  auto source = ByteSource::from_path(path);
  if (!source) {
    return Result<bool>::failure(source.error);
  }
  return impl_->set_source(std::move(source.value));
}

Result<bool> Pipeline::open_mapped(const std::string& path) {
  auto source = ByteSource::from_mapped_path(path);
  if (!source) {
    return Result<bool>::failure(source.error);
  }
  return impl_->set_source(std::move(source.value));
}

Result<bool> Pipeline::open_from_buffer(std::vector<uint8_t> bytes) {
  return impl_->set_source(ByteSource::from_bytes(std::move(bytes)));
}

Result<bool> Pipeline::open_from_buffer(std::string_view bytes) {
  return impl_->set_source(ByteSource::from_bytes(bytes));
}

Result<bool> Pipeline::open_source(ByteSource source) {
  return impl_->set_source(std::move(source));
}

Result<bool> Pipeline::start() {
  return impl_->start();
}

StreamItem Pipeline::next() {
  if (impl_->finished) {
    return StreamItem::exhausted();
  }
  if (!impl_->started && !impl_->start()) {
    impl_->finished = true;
    return StreamItem::exhausted();
  }

  if (auto item = impl_->channel->pop()) {
    return impl_->deliver(std::move(*item));
  }
  return impl_->finish_consumer();
}

std::optional<StreamItem> Pipeline::try_next() {
  if (impl_->finished) {
    return StreamItem::exhausted();
  }
  if (!impl_->started && !impl_->start()) {
    impl_->finished = true;
    return StreamItem::exhausted();
  }

  std::optional<StreamItem> item;
  switch (impl_->channel->try_pop(item)) {
  case RecordChannel<StreamItem>::TryPop::ITEM:
    return impl_->deliver(std::move(*item));
  case RecordChannel<StreamItem>::TryPop::EMPTY:
    return std::nullopt;
  case RecordChannel<StreamItem>::TryPop::DONE:
  default:
    return impl_->finish_consumer();
  }
}

void Pipeline::close() {
  impl_->shutdown();
}

bool Pipeline::is_running() const {
  return impl_->started && !impl_->finished;
}

size_t Pipeline::records_delivered() const {
  return impl_->records_delivered;
}

size_t Pipeline::channel_size() const {
  return impl_->channel ? impl_->channel->size() : 0;
}

size_t Pipeline::channel_high_water_mark() const {
  return impl_->channel ? impl_->channel->high_water_mark() : 0;
}

const ErrorCollector& Pipeline::errors() const {
  return impl_->errors;
}

const PipelineOptions& Pipeline::options() const {
  return impl_->options;
}

} // namespace libmarc

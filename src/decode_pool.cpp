#include "libmarc/decode_pool.h"

#include "BS_thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <string>

namespace libmarc {

namespace {

DecodeResult internal_error(size_t offset, std::string message) {
  return ParseError(ErrorCode::INTERNAL_ERROR, offset, std::move(message));
}

} // namespace

struct DecodePool::Impl {
  DecodeOptions decode;
  size_t num_threads = 1;
  std::unique_ptr<BS::thread_pool> pool;

  Impl(const ThreadOptions& threads, const DecodeOptions& opts)
      : decode(opts), num_threads(resolve_num_threads(threads)) {
    if (num_threads > 1) {
      pool = std::make_unique<BS::thread_pool>(num_threads);
    }
    SPDLOG_DEBUG("Decode pool started with {} thread(s)", num_threads);
  }

  // results[i] = decode_at(i), with any escaping exception converted into an
  // INTERNAL_ERROR attributed to offset_of(i).
  template <typename DecodeAt, typename OffsetOf>
  static DecodeResult guarded(size_t i, const DecodeAt& decode_at, const OffsetOf& offset_of) {
    try {
      return decode_at(i);
    } catch (const std::exception& e) {
      auto error = internal_error(offset_of(i), std::string("Decode task failed: ") + e.what());
      std::get<ParseError>(error).record_index = i;
      return error;
    } catch (...) {
      auto error = internal_error(offset_of(i), "Decode task failed with a non-standard exception");
      std::get<ParseError>(error).record_index = i;
      return error;
    }
  }

  // Fills results[0..n), splitting the index range into contiguous slices
  // when the batch is large enough to be worth it.
  template <typename DecodeAt, typename OffsetOf>
  std::vector<DecodeResult> run(size_t n, const DecodeAt& decode_at, const OffsetOf& offset_of) {
    std::vector<DecodeResult> results(n);
    if (n == 0)
      return results;

    const size_t min_per_task = ThreadOptions::MIN_RECORDS_PER_TASK;
    if (!pool || n < 2 * min_per_task) {
      for (size_t i = 0; i < n; ++i)
        results[i] = guarded(i, decode_at, offset_of);
      return results;
    }

    size_t num_tasks = std::min(num_threads * 4, (n + min_per_task - 1) / min_per_task);
    size_t per_task = (n + num_tasks - 1) / num_tasks;

    std::vector<std::future<void>> futures;
    futures.reserve(num_tasks);
    for (size_t lo = 0; lo < n; lo += per_task) {
      size_t hi = std::min(n, lo + per_task);
      futures.push_back(pool->submit_task([&results, &decode_at, &offset_of, lo, hi]() {
        for (size_t i = lo; i < hi; ++i)
          results[i] = guarded(i, decode_at, offset_of);
      }));
    }
    for (auto& f : futures)
      f.get();
    return results;
  }
};

DecodePool::DecodePool(const ThreadOptions& threads, const DecodeOptions& decode)
    : impl_(std::make_unique<Impl>(threads, decode)) {}

DecodePool::~DecodePool() = default;

size_t DecodePool::num_threads() const {
  return impl_->num_threads;
}

const DecodeOptions& DecodePool::decode_options() const {
  return impl_->decode;
}

std::vector<DecodeResult> DecodePool::decode_batch(const std::vector<RecordBoundary>& boundaries,
                                                   const uint8_t* data, size_t size,
                                                   size_t base_offset) {
  const DecodeOptions& options = impl_->decode;
  auto offset_of = [&](size_t i) { return base_offset + boundaries[i].offset; };
  return impl_->run(
      boundaries.size(),
      [&](size_t i) -> DecodeResult {
        const RecordBoundary& b = boundaries[i];
        if (b.offset > size || b.length > size - b.offset) {
          return internal_error(offset_of(i), "Record boundary (offset " + std::to_string(b.offset) +
                                                  ", length " + std::to_string(b.length) +
                                                  ") lies outside the buffer");
        }
        return decode_record(data + b.offset, b.length, options, offset_of(i));
      },
      offset_of);
}

std::vector<DecodeResult> DecodePool::decode_owned(const std::vector<RecordBytes>& records,
                                                   const std::vector<size_t>& offsets) {
  const DecodeOptions& options = impl_->decode;
  auto offset_of = [&](size_t i) -> size_t { return i < offsets.size() ? offsets[i] : 0; };
  return impl_->run(
      records.size(),
      [&](size_t i) {
        return decode_record(records[i].data(), records[i].size(), options, offset_of(i));
      },
      offset_of);
}

std::vector<DecodeResult> DecodePool::map_indexed(size_t n, const DecodeTask& task) {
  return impl_->run(n, task, [](size_t) -> size_t { return 0; });
}

} // namespace libmarc

#pragma once

#include "byte_source.h"
#include "error.h"
#include "options.h"
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

/**
 * @brief Streams records from a file or buffer through a background producer.
 *
 * A dedicated producer thread reads fixed-size chunks, carries any partial
 * record over to the next chunk, finds record boundaries, decodes them on the
 * decode pool, and pushes the results, in stream order, into a bounded
 * channel. A full channel blocks the producer, which bounds memory however
 * slowly the consumer reads.
 *
 * The consumer sees, in order: a record or a per-record ParseError for each
 * span; at most one terminal StreamError; then the exhausted sentinel on every
 * later call.
 *
 * Host streams are not accepted: reading them off the host's thread would
 * break the host lock contract. Use BatchedReader for those.
 *
 * @example
 * @code
 * libmarc::Pipeline pipeline;
 * if (auto opened = pipeline.open("records.mrc"); !opened) { ... }
 * for (auto item = pipeline.next(); !item.is_exhausted(); item = pipeline.next()) {
 *   if (item.is_record()) consume(item.take_record());
 * }
 * @endcode
 */
class Pipeline {
public:
  explicit Pipeline(const PipelineOptions& options = {});
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Open a file, read through stdio
  Result<bool> open(const std::string& path);

  // Open a file through a read-only memory mapping
  Result<bool> open_mapped(const std::string& path);

  // Open from a pre-loaded buffer (takes a copy)
  Result<bool> open_from_buffer(std::vector<uint8_t> bytes);
  Result<bool> open_from_buffer(std::string_view bytes);

  // Fails for host stream sources
  Result<bool> open_source(ByteSource source);

  // Start the producer thread. next() and try_next() start it on first use.
  Result<bool> start();

  // Blocks until an item is available or the stream is done.
  StreamItem next();

  // Non-blocking. nullopt means nothing is ready yet but the stream is still
  // open; once done, returns the same items next() would.
  std::optional<StreamItem> try_next();

  // Stop the producer and release the channel. Safe to call from another
  // thread while next() is blocked; that call returns exhausted.
  void close();

  bool is_running() const;
  size_t records_delivered() const;
  size_t channel_size() const;
  size_t channel_high_water_mark() const;
  const ErrorCollector& errors() const;
  const PipelineOptions& options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace libmarc

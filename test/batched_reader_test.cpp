/**
 * @file batched_reader_test.cpp
 * @brief Tests for BatchedReader over memory, file and host stream sources.
 *
 * Host streams are simulated with CallbackHostStream over a string, served
 * in small pieces so records straddle reads. A counting HostRuntime checks
 * that reads happen under the host lock and that decoding releases it.
 */

#include "test_util.h"

#include <algorithm>
#include <cstring>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

using libmarc::BatchedReader;
using libmarc::CallbackHostStream;
using libmarc::ErrorCode;
using libmarc::HostLockGuard;
using libmarc::ParseError;
using libmarc::Record;
using libmarc::RecordBatch;
using libmarc::Result;
using libmarc::StreamItem;

namespace {

// HostRuntime that counts lock transitions and knows whether it is held.
class CountingRuntime : public libmarc::HostRuntime {
public:
  void acquire() override {
    mutex_.lock();
    held_ = true;
    ++acquires_;
  }
  void release() override {
    held_ = false;
    ++releases_;
    mutex_.unlock();
  }

  bool held() const { return held_; }
  size_t acquires() const { return acquires_; }
  size_t releases() const { return releases_; }

private:
  std::mutex mutex_;
  bool held_ = false;
  size_t acquires_ = 0;
  size_t releases_ = 0;
};

// Host stream over content, at most piece bytes per read. After fail_after
// successful reads every read fails.
struct ScriptedStream {
  std::string content;
  size_t piece = 7;
  size_t fail_after = static_cast<size_t>(-1);
  CountingRuntime* runtime = nullptr;

  size_t pos = 0;
  size_t reads = 0;
  bool read_without_lock = false;

  std::shared_ptr<CallbackHostStream> make() {
    return std::make_shared<CallbackHostStream>([this](uint8_t* buf, size_t n) {
      if (runtime && !runtime->held())
        read_without_lock = true;
      if (reads++ >= fail_after)
        return Result<size_t>::failure("connection reset by host");
      size_t take = std::min({n, piece, content.size() - pos});
      std::memcpy(buf, content.data() + pos, take);
      pos += take;
      return Result<size_t>::success(std::move(take));
    });
  }
};

std::vector<StreamItem> drain_items(BatchedReader& reader) {
  std::vector<StreamItem> items;
  for (auto item = reader.next(); !item.is_exhausted(); item = reader.next()) {
    items.push_back(std::move(item));
  }
  return items;
}

} // namespace

// =============================================================================
// Memory and file sources
// =============================================================================

TEST(BatchedReaderTest, ReadsAllRecordsInOrder) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(250)).ok);
  EXPECT_EQ(reader.state(), BatchedReader::State::INITIAL);

  size_t seen = 0;
  while (true) {
    RecordBatch batch = reader.next_batch();
    if (batch.empty())
      break;
    EXPECT_LE(batch.size(), reader.options().batch_size);
    EXPECT_FALSE(batch.stream_error.has_value());
    for (auto& record : batch.take_records()) {
      EXPECT_EQ(record.control_field("001"), "ocm" + std::to_string(seen));
      ++seen;
    }
  }
  EXPECT_EQ(seen, 250u);
  EXPECT_EQ(reader.records_read(), 250u);
  EXPECT_TRUE(reader.is_eof());
  EXPECT_FALSE(reader.errors().has_errors());
}

TEST(BatchedReaderTest, EndOfStreamIsIdempotent) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(3)).ok);
  EXPECT_EQ(drain_items(reader).size(), 3u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(reader.next().is_exhausted());
    EXPECT_TRUE(reader.next_batch().empty());
  }
  EXPECT_EQ(reader.state(), BatchedReader::State::END_OF_STREAM);
}

TEST(BatchedReaderTest, EmptyInputEndsImmediately) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(std::string_view()).ok);
  EXPECT_TRUE(reader.next_batch().empty());
  EXPECT_TRUE(reader.is_eof());
}

TEST(BatchedReaderTest, UnopenedReaderIsExhausted) {
  BatchedReader reader;
  EXPECT_TRUE(reader.next_batch().empty());
  EXPECT_TRUE(reader.next().is_exhausted());
}

TEST(BatchedReaderTest, OpenFile) {
  const std::string content = test_util::make_stream(40);
  test_util::TempFile file(content);
  BatchedReader reader;
  ASSERT_TRUE(reader.open(file.path()).ok);
  EXPECT_EQ(drain_items(reader).size(), 40u);
  EXPECT_EQ(reader.bytes_consumed(), content.size());
}

TEST(BatchedReaderTest, OpenMissingFileFails) {
  BatchedReader reader;
  EXPECT_FALSE(reader.open("/tmp/libmarc_reader_missing.mrc").ok);
}

// =============================================================================
// Batch limits
// =============================================================================

TEST(BatchedReaderTest, RecordCeilingApplies) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(500)).ok);
  RecordBatch batch = reader.next_batch(1000, 10 * 1024 * 1024);
  EXPECT_EQ(batch.size(), libmarc::ReaderOptions::MAX_BATCH_RECORDS);
}

TEST(BatchedReaderTest, ByteLimitStillAdmitsOneRecord) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(5)).ok);
  for (int i = 0; i < 5; ++i) {
    RecordBatch batch = reader.next_batch(100, 1);
    ASSERT_EQ(batch.size(), 1u);
  }
  EXPECT_TRUE(reader.next_batch(100, 1).empty());
}

TEST(BatchedReaderTest, ByteLimitSplitsBatches) {
  libmarc::ReaderOptions options;
  options.max_batch_bytes = 1000; // 6 records of 149 bytes
  BatchedReader reader(options);
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(10)).ok);
  EXPECT_EQ(reader.next_batch(100, 1 << 20).size(), 6u);
  EXPECT_EQ(reader.next_batch(100, 1 << 20).size(), 4u);
}

// =============================================================================
// Errors
// =============================================================================

TEST(BatchedReaderTest, CorruptRecordIsIsolated) {
  std::string stream = test_util::make_stream(10);
  stream[3 * 149 + 10] = 'X'; // indicator count of record 3

  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(stream).ok);
  RecordBatch batch = reader.next_batch();
  ASSERT_EQ(batch.size(), 10u);
  EXPECT_EQ(batch.record_count(), 9u);
  EXPECT_EQ(batch.error_count(), 1u);

  auto errors = batch.parse_errors();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].code, ErrorCode::INVALID_LEADER);
  EXPECT_EQ(errors[0].byte_offset, 3u * 149 + 10);
  EXPECT_EQ(errors[0].record_index, 3u);

  ASSERT_EQ(reader.errors().error_count(), 1u);
  EXPECT_EQ(reader.errors().errors()[0].record_index, 3u);
}

TEST(BatchedReaderTest, TrailingPaddingIsIgnored) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(2) + "\r\n\n  ").ok);
  auto items = drain_items(reader);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_TRUE(items[1].is_record());
}

TEST(BatchedReaderTest, ShortTailIsUnexpectedEndOfStream) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(2) + "001").ok);
  auto items = drain_items(reader);
  ASSERT_EQ(items.size(), 3u);
  EXPECT_TRUE(items[0].is_record());
  EXPECT_TRUE(items[1].is_record());
  ASSERT_TRUE(items[2].is_stream_error());
  EXPECT_EQ(items[2].stream_error().code, ErrorCode::UNEXPECTED_END_OF_STREAM);
  EXPECT_EQ(items[2].stream_error().byte_offset, 2u * 149);
  EXPECT_TRUE(reader.next().is_exhausted());
}

TEST(BatchedReaderTest, TruncatedTailIsRecordError) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(2) + "00149nam a22").ok);
  auto items = drain_items(reader);
  ASSERT_EQ(items.size(), 3u);
  ASSERT_TRUE(items[2].is_parse_error());
  const ParseError& error = items[2].parse_error();
  EXPECT_EQ(error.code, ErrorCode::TRUNCATED_RECORD);
  EXPECT_EQ(error.expected, 149u);
  EXPECT_EQ(error.actual, 12u);
  EXPECT_EQ(error.byte_offset, 2u * 149);
  EXPECT_EQ(error.record_index, 2u);
}

// =============================================================================
// Host streams
// =============================================================================

TEST(BatchedReaderTest, HostStreamReadsUnderLockAndDecodesWithout) {
  CountingRuntime runtime;
  ScriptedStream script;
  script.content = test_util::make_stream(30);
  script.runtime = &runtime;

  BatchedReader reader;
  ASSERT_TRUE(reader.open_host_stream(script.make()).ok);

  HostLockGuard guard(runtime);
  const size_t releases_before = runtime.releases();

  RecordBatch batch = reader.next_batch(guard.token());
  EXPECT_EQ(batch.record_count(), 30u);
  EXPECT_FALSE(script.read_without_lock);
  EXPECT_TRUE(runtime.held());
  // One release for the decode step, reacquired before returning
  EXPECT_EQ(runtime.releases(), releases_before + 1);
  EXPECT_EQ(runtime.acquires(), runtime.releases() + 1);

  EXPECT_TRUE(reader.next_batch(guard.token()).empty());
  EXPECT_TRUE(reader.is_eof());
}

TEST(BatchedReaderTest, HostStreamItemsMatchMemoryItems) {
  const std::string content = test_util::make_stream(120);
  libmarc::MutexHostRuntime runtime;
  ScriptedStream script;
  script.content = content;
  script.piece = 13;

  BatchedReader host_reader;
  ASSERT_TRUE(host_reader.open_host_stream(script.make()).ok);
  std::vector<Record> from_host;
  {
    HostLockGuard guard(runtime);
    for (auto item = host_reader.next(guard.token()); !item.is_exhausted();
         item = host_reader.next(guard.token())) {
      ASSERT_TRUE(item.is_record());
      from_host.push_back(item.take_record());
    }
  }

  BatchedReader memory_reader;
  ASSERT_TRUE(memory_reader.open_from_buffer(content).ok);
  std::vector<Record> from_memory;
  for (auto& item : drain_items(memory_reader))
    from_memory.push_back(item.take_record());

  ASSERT_EQ(from_host.size(), 120u);
  EXPECT_EQ(from_host, from_memory);
}

TEST(BatchedReaderTest, HostStreamWithoutTokenIsUnsupported) {
  ScriptedStream script;
  script.content = test_util::make_stream(3);
  BatchedReader reader;
  ASSERT_TRUE(reader.open_host_stream(script.make()).ok);

  RecordBatch batch = reader.next_batch();
  ASSERT_TRUE(batch.stream_error.has_value());
  EXPECT_EQ(batch.stream_error->code, ErrorCode::UNSUPPORTED_SOURCE);
  EXPECT_EQ(script.reads, 0u);
  EXPECT_TRUE(reader.is_eof());
  EXPECT_TRUE(reader.next().is_exhausted());
}

TEST(BatchedReaderTest, IoErrorFollowsCompletedRecords) {
  CountingRuntime runtime;
  ScriptedStream script;
  script.content = test_util::make_stream(10);
  script.piece = 400;
  script.fail_after = 2; // 800 bytes: 5 whole records and part of a sixth

  BatchedReader reader;
  ASSERT_TRUE(reader.open_host_stream(script.make()).ok);
  HostLockGuard guard(runtime);

  RecordBatch batch = reader.next_batch(guard.token());
  EXPECT_EQ(batch.record_count(), 5u);
  ASSERT_TRUE(batch.stream_error.has_value());
  EXPECT_EQ(batch.stream_error->code, ErrorCode::IO_ERROR);
  EXPECT_EQ(batch.stream_error->byte_offset, 800u);
  EXPECT_NE(batch.stream_error->message.find("connection reset"), std::string::npos);

  // Terminal: no further reads and no repeated error
  const size_t reads = script.reads;
  for (int i = 0; i < 3; ++i) {
    RecordBatch after = reader.next_batch(guard.token());
    EXPECT_TRUE(after.empty());
  }
  EXPECT_EQ(script.reads, reads);
}

TEST(BatchedReaderTest, IoErrorThroughNextIsDeliveredOnce) {
  libmarc::MutexHostRuntime runtime;
  ScriptedStream script;
  script.content = test_util::make_stream(4);
  script.piece = 149;
  script.fail_after = 2;

  BatchedReader reader;
  ASSERT_TRUE(reader.open_host_stream(script.make()).ok);
  HostLockGuard guard(runtime);

  std::vector<StreamItem> items;
  for (auto item = reader.next(guard.token()); !item.is_exhausted();
       item = reader.next(guard.token())) {
    items.push_back(std::move(item));
  }
  ASSERT_EQ(items.size(), 3u);
  EXPECT_TRUE(items[0].is_record());
  EXPECT_TRUE(items[1].is_record());
  EXPECT_TRUE(items[2].is_stream_error());
  EXPECT_TRUE(reader.next(guard.token()).is_exhausted());
}

// =============================================================================
// Input without terminators
// =============================================================================

TEST(BatchedReaderTest, TerminatorFreeHostStreamStaysBounded) {
  constexpr size_t kTotal = 8 * 1024 * 1024;
  constexpr size_t kMaxBytes = 300 * 1024;
  size_t pulled = 0;
  auto stream = std::make_shared<CallbackHostStream>([&](uint8_t* buf, size_t n) {
    size_t take = std::min(n, kTotal - pulled);
    std::memset(buf, '0', take);
    pulled += take;
    return Result<size_t>::success(std::move(take));
  });

  libmarc::ReaderOptions options;
  BatchedReader reader(options);
  ASSERT_TRUE(reader.open_host_stream(stream).ok);
  libmarc::MutexHostRuntime runtime;
  HostLockGuard guard(runtime);

  const size_t bound = kMaxBytes + options.read_size + libmarc::MAX_RECORD_LENGTH;
  std::vector<ParseError> errors;
  while (true) {
    const size_t before = pulled;
    RecordBatch batch = reader.next_batch(guard.token(), 100, kMaxBytes);
    EXPECT_LE(pulled - before, bound);
    EXPECT_FALSE(batch.stream_error.has_value());
    if (batch.empty())
      break;
    EXPECT_EQ(batch.record_count(), 0u);
    for (auto& result : batch.results) {
      ASSERT_TRUE(std::holds_alternative<ParseError>(result));
      errors.push_back(std::get<ParseError>(result));
    }
  }

  EXPECT_EQ(pulled, kTotal);
  const size_t runs = kTotal / libmarc::MAX_RECORD_LENGTH; // 83
  ASSERT_EQ(errors.size(), runs + 1);
  for (size_t i = 0; i < runs; ++i) {
    EXPECT_EQ(errors[i].code, ErrorCode::MISSING_TERMINATOR) << "run " << i;
    EXPECT_EQ(errors[i].byte_offset, i * libmarc::MAX_RECORD_LENGTH) << "run " << i;
    EXPECT_EQ(errors[i].record_index, i);
  }
  // The short remainder reaches the decoder like any other tail
  EXPECT_EQ(errors.back().code, ErrorCode::INVALID_LENGTH_HEADER);
  EXPECT_EQ(errors.back().byte_offset, runs * libmarc::MAX_RECORD_LENGTH);
  EXPECT_EQ(reader.errors().error_count(), runs + 1);
  EXPECT_TRUE(reader.is_eof());
}

TEST(BatchedReaderTest, OverlongSpanIsCutIntoRuns) {
  const std::string first = test_util::encode_or_fail(test_util::sample_record(0));
  const std::string garbage(150000, 'x');
  std::string stream = first + garbage + test_util::encode_or_fail(test_util::sample_record(1));

  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(stream).ok);
  auto items = drain_items(reader);
  ASSERT_EQ(items.size(), 3u);
  EXPECT_TRUE(items[0].is_record());
  ASSERT_TRUE(items[1].is_parse_error());
  EXPECT_EQ(items[1].parse_error().code, ErrorCode::MISSING_TERMINATOR);
  EXPECT_EQ(items[1].parse_error().byte_offset, first.size());
  // The rest of the garbage swallows the next record up to its terminator
  ASSERT_TRUE(items[2].is_parse_error());
  EXPECT_EQ(items[2].parse_error().code, ErrorCode::INVALID_LENGTH_HEADER);
  EXPECT_EQ(items[2].parse_error().byte_offset, first.size() + libmarc::MAX_RECORD_LENGTH);
}

// =============================================================================
// Reader lifecycle
// =============================================================================

TEST(BatchedReaderTest, MovedReaderContinues) {
  BatchedReader a;
  ASSERT_TRUE(a.open_from_buffer(test_util::make_stream(6)).ok);
  EXPECT_EQ(a.next_batch(2, 1 << 20).size(), 2u);

  BatchedReader b(std::move(a));
  RecordBatch rest = b.next_batch();
  ASSERT_EQ(rest.size(), 4u);
  EXPECT_EQ(rest.take_records()[0].control_field("001"), "ocm2");
}

TEST(BatchedReaderTest, ReopenResetsState) {
  BatchedReader reader;
  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(2)).ok);
  drain_items(reader);
  ASSERT_TRUE(reader.is_eof());

  ASSERT_TRUE(reader.open_from_buffer(test_util::make_stream(3)).ok);
  EXPECT_EQ(reader.state(), BatchedReader::State::INITIAL);
  EXPECT_EQ(drain_items(reader).size(), 3u);
  EXPECT_EQ(reader.records_read(), 3u);
}

TEST(BatchedReaderTest, StateNames) {
  EXPECT_STREQ(libmarc::reader_state_name(BatchedReader::State::INITIAL), "INITIAL");
  EXPECT_STREQ(libmarc::reader_state_name(BatchedReader::State::READING), "READING");
  EXPECT_STREQ(libmarc::reader_state_name(BatchedReader::State::END_OF_STREAM), "END_OF_STREAM");
}

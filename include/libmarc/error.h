#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @file error.h
 * @brief Error values for record decoding and stream reading.
 *
 * Two kinds of errors exist. A ParseError belongs to a single record: the
 * record is skipped, and reading continues with the next one. A StreamError
 * ends the stream: it is delivered once, after which every read reports
 * exhaustion.
 *
 * Both are plain value types. They own no handles and are never thrown, so
 * they can be built on worker threads or while the host lock is released.
 */

namespace libmarc {

/**
 * @brief Error codes for record and stream faults.
 *
 * Codes are grouped by category:
 * - Record framing (INVALID_LENGTH_HEADER, MISSING_TERMINATOR, TRUNCATED_RECORD)
 * - Record structure (INVALID_LEADER, INVALID_DIRECTORY, INVALID_FIELD)
 * - Character data (ENCODING_ERROR)
 * - Stream level (IO_ERROR, UNEXPECTED_END_OF_STREAM, UNSUPPORTED_SOURCE)
 * - General (INTERNAL_ERROR)
 */
enum class ErrorCode {
  NONE = 0, ///< No error

  // Record framing
  INVALID_LENGTH_HEADER, ///< Length header is not five digits, is zero, or disagrees with the span
  MISSING_TERMINATOR,    ///< Final byte is not the record terminator
  TRUNCATED_RECORD,      ///< Fewer bytes available than the length header declares

  // Record structure
  INVALID_LEADER,    ///< Leader positions fail validation
  INVALID_DIRECTORY, ///< Directory entry malformed or directory unterminated
  INVALID_FIELD,     ///< Field slice out of range or malformed

  // Character data
  ENCODING_ERROR, ///< Invalid UTF-8 in a record that declares Unicode

  // Stream level
  IO_ERROR,                 ///< Underlying read failed
  UNEXPECTED_END_OF_STREAM, ///< Stream ended inside a length header
  UNSUPPORTED_SOURCE,       ///< Source kind not accepted by this reader

  INTERNAL_ERROR ///< Unexpected fault inside a decode task
};

const char* error_code_to_string(ErrorCode code);

/// Sentinel for ParseError::record_index when the index is unknown.
constexpr size_t UNKNOWN_RECORD_INDEX = static_cast<size_t>(-1);

/**
 * @brief A fault confined to one record.
 *
 * byte_offset locates the fault. Decoders report it relative to the start of
 * the stream when the caller supplies a base offset, otherwise relative to
 * the start of the record. For TRUNCATED_RECORD, expected and actual hold
 * the declared and available lengths.
 */
struct ParseError {
  ErrorCode code = ErrorCode::NONE;
  size_t byte_offset = 0;
  size_t expected = 0;
  size_t actual = 0;
  size_t record_index = UNKNOWN_RECORD_INDEX;
  std::string message;

  ParseError() = default;
  ParseError(ErrorCode c, size_t offset, std::string msg)
      : code(c), byte_offset(offset), message(std::move(msg)) {}

  static ParseError truncated(size_t offset, size_t expected_len, size_t actual_len);

  std::string to_string() const;

  bool operator==(const ParseError& other) const {
    return code == other.code && byte_offset == other.byte_offset && expected == other.expected &&
           actual == other.actual;
  }
};

/// Terminal, stream-level failure. Surfaced exactly once per reader.
struct StreamError {
  ErrorCode code = ErrorCode::IO_ERROR;
  size_t byte_offset = 0; ///< Stream position where the failure was detected
  std::string message;

  std::string to_string() const;
};

/**
 * @brief Collects per-record errors up to a limit.
 *
 * Readers own one collector. Errors past max_errors are counted but not
 * stored, which bounds memory on severely damaged input.
 *
 * @note Not thread-safe. Only the thread that consumes a reader's results
 * adds to its collector.
 */
class ErrorCollector {
public:
  static constexpr size_t DEFAULT_MAX_ERRORS = 10000;

  explicit ErrorCollector(size_t max_errors = DEFAULT_MAX_ERRORS) : max_errors_(max_errors) {}

  void add_error(const ParseError& error) {
    if (errors_.size() >= max_errors_) {
      ++suppressed_count_;
      return;
    }
    errors_.push_back(error);
  }

  bool at_error_limit() const { return errors_.size() >= max_errors_; }
  bool has_errors() const { return !errors_.empty(); }
  size_t error_count() const { return errors_.size(); }
  size_t suppressed_count() const { return suppressed_count_; }
  size_t max_errors() const { return max_errors_; }
  const std::vector<ParseError>& errors() const { return errors_; }

  std::string summary() const;

  void clear() {
    errors_.clear();
    suppressed_count_ = 0;
  }

private:
  std::vector<ParseError> errors_;
  size_t max_errors_;
  size_t suppressed_count_ = 0;
};

} // namespace libmarc

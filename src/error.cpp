#include "libmarc/error.h"

#include <sstream>

namespace libmarc {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::INVALID_LENGTH_HEADER:
    return "INVALID_LENGTH_HEADER";
  case ErrorCode::MISSING_TERMINATOR:
    return "MISSING_TERMINATOR";
  case ErrorCode::TRUNCATED_RECORD:
    return "TRUNCATED_RECORD";
  case ErrorCode::INVALID_LEADER:
    return "INVALID_LEADER";
  case ErrorCode::INVALID_DIRECTORY:
    return "INVALID_DIRECTORY";
  case ErrorCode::INVALID_FIELD:
    return "INVALID_FIELD";
  case ErrorCode::ENCODING_ERROR:
    return "ENCODING_ERROR";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::UNEXPECTED_END_OF_STREAM:
    return "UNEXPECTED_END_OF_STREAM";
  case ErrorCode::UNSUPPORTED_SOURCE:
    return "UNSUPPORTED_SOURCE";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

ParseError ParseError::truncated(size_t offset, size_t expected_len, size_t actual_len) {
  ParseError error(ErrorCode::TRUNCATED_RECORD, offset,
                   "Record declares " + std::to_string(expected_len) + " bytes but only " +
                       std::to_string(actual_len) + " are available");
  error.expected = expected_len;
  error.actual = actual_len;
  return error;
}

std::string ParseError::to_string() const {
  std::ostringstream ss;
  ss << error_code_to_string(code) << " at byte " << byte_offset;
  if (record_index != UNKNOWN_RECORD_INDEX) {
    ss << " (record " << record_index << ")";
  }
  ss << ": " << message;
  return ss.str();
}

std::string StreamError::to_string() const {
  std::ostringstream ss;
  ss << "[STREAM] " << error_code_to_string(code) << " at byte " << byte_offset << ": " << message;
  return ss.str();
}

std::string ErrorCollector::summary() const {
  if (errors_.empty()) {
    return "No errors";
  }

  std::ostringstream ss;
  ss << "Total errors: " << errors_.size();
  if (suppressed_count_ > 0) {
    ss << " (" << suppressed_count_ << " more suppressed)";
  }
  ss << "\n";
  for (const auto& err : errors_) {
    ss << "  " << err.to_string() << "\n";
  }
  return ss.str();
}

} // namespace libmarc

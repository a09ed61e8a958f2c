#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace libmarc {

// ISO 2709 structural bytes
constexpr uint8_t RECORD_TERMINATOR = 0x1D;
constexpr uint8_t FIELD_TERMINATOR = 0x1E;
constexpr uint8_t SUBFIELD_DELIMITER = 0x1F;

constexpr size_t LEADER_LENGTH = 24;
constexpr size_t LENGTH_HEADER_DIGITS = 5;
constexpr size_t DIRECTORY_ENTRY_LENGTH = 12;
constexpr size_t MAX_RECORD_LENGTH = 99999;

// Tags "001".."009" carry control fields (no indicators, no subfields)
inline bool is_control_tag(const std::string& tag) {
  return tag.size() == 3 && tag[0] == '0' && tag[1] == '0' && tag[2] >= '1' && tag[2] <= '9';
}

// A span of one undecoded record inside a byte buffer.
// length includes the record terminator.
struct RecordBoundary {
  size_t offset = 0;
  size_t length = 0;

  size_t end() const { return offset + length; }

  bool operator==(const RecordBoundary& other) const {
    return offset == other.offset && length == other.length;
  }
};

// Result type for operations that can fail
template <typename T> struct Result {
  T value;
  std::string error;
  bool ok = true;

  static Result success(T&& val) { return {std::move(val), "", true}; }
  static Result failure(std::string err) { return {{}, std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

// Specialization for void result (operations that succeed or fail with no value)
template <> struct Result<void> {
  std::string error;
  bool ok = true;

  static Result success() { return {"", true}; }
  static Result failure(std::string err) { return {std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

} // namespace libmarc

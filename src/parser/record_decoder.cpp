#include "libmarc/record_decoder.h"

#include <simdutf.h>

#include <string>
#include <utility>

namespace libmarc {

namespace {

bool is_digit(uint8_t c) {
  return c >= '0' && c <= '9';
}

bool parse_fixed_digits(const uint8_t* p, size_t count, size_t& out) {
  size_t value = 0;
  for (size_t i = 0; i < count; ++i) {
    if (!is_digit(p[i]))
      return false;
    value = value * 10 + static_cast<size_t>(p[i] - '0');
  }
  out = value;
  return true;
}

// Printable ASCII, excluding space
bool is_tag_byte(uint8_t c) {
  return c > 0x20 && c < 0x7F;
}

// Splits a data field into indicators and subfields. On failure, fault is
// the position inside the field that could not be parsed.
bool parse_data_field(const uint8_t* field, size_t length, std::string tag, size_t indicator_count,
                      Field& out, size_t& fault, std::string& message) {
  if (length < indicator_count) {
    fault = 0;
    message = "Data field " + tag + " is too short for its indicators";
    return false;
  }

  out = Field(std::move(tag), indicator_count >= 1 ? static_cast<char>(field[0]) : ' ',
              indicator_count >= 2 ? static_cast<char>(field[1]) : ' ');

  size_t p = indicator_count;
  while (p < length) {
    if (field[p] == FIELD_TERMINATOR)
      break;
    if (field[p] != SUBFIELD_DELIMITER) {
      fault = p;
      message = "Expected subfield delimiter in field " + out.tag;
      return false;
    }
    ++p;
    // A delimiter with no code before the end of the field carries nothing
    if (p >= length || field[p] == FIELD_TERMINATOR)
      break;

    char code = static_cast<char>(field[p]);
    ++p;
    size_t end = p;
    while (end < length && field[end] != SUBFIELD_DELIMITER && field[end] != FIELD_TERMINATOR) {
      ++end;
    }
    out.add_subfield(code, std::string(reinterpret_cast<const char*>(field + p), end - p));
    p = end;
  }
  return true;
}

} // namespace

size_t parse_length_header(const uint8_t* data) {
  size_t value = 0;
  if (!parse_fixed_digits(data, LENGTH_HEADER_DIGITS, value))
    return 0;
  return value;
}

ParseError unterminated_run_error(size_t offset) {
  return ParseError(ErrorCode::MISSING_TERMINATOR, offset,
                    "No record terminator within " + std::to_string(MAX_RECORD_LENGTH) + " bytes");
}

DecodeResult decode_record(const uint8_t* data, size_t size, const DecodeOptions& options,
                           size_t base_offset) {
  auto fail = [base_offset](ErrorCode code, size_t pos, std::string message) -> DecodeResult {
    return ParseError(code, base_offset + pos, std::move(message));
  };

  // 1. Length header
  if (size == 0) {
    return fail(ErrorCode::INVALID_LENGTH_HEADER, 0, "Empty record span");
  }
  const size_t header_bytes = size < LENGTH_HEADER_DIGITS ? size : LENGTH_HEADER_DIGITS;
  for (size_t i = 0; i < header_bytes; ++i) {
    if (!is_digit(data[i])) {
      return fail(ErrorCode::INVALID_LENGTH_HEADER, i,
                  "Length header byte " + std::to_string(i) + " is not a digit");
    }
  }
  if (size < LENGTH_HEADER_DIGITS) {
    return ParseError::truncated(base_offset, LENGTH_HEADER_DIGITS, size);
  }

  const size_t declared = parse_length_header(data);
  if (declared == 0) {
    return fail(ErrorCode::INVALID_LENGTH_HEADER, 0, "Length header is zero");
  }

  // 2. Declared vs. actual length
  if (declared > size) {
    return ParseError::truncated(base_offset, declared, size);
  }
  if (declared < size) {
    return fail(ErrorCode::INVALID_LENGTH_HEADER, 0,
                "Length header declares " + std::to_string(declared) + " bytes but the record spans " +
                    std::to_string(size));
  }
  if (size < LEADER_LENGTH + 1) {
    return fail(ErrorCode::INVALID_LEADER, size,
                "Record of " + std::to_string(size) + " bytes cannot hold a leader and terminator");
  }

  // 3. Leader
  size_t fault = 0;
  auto leader = Leader::parse(data, size, &fault);
  if (!leader) {
    return fail(ErrorCode::INVALID_LEADER, fault, leader.error);
  }
  if (auto valid = leader.value.validate_for_reading(&fault); !valid) {
    return fail(ErrorCode::INVALID_LEADER, fault, valid.error);
  }
  const size_t base = leader.value.data_base_address;
  if (base >= size) {
    return fail(ErrorCode::INVALID_LEADER, 12,
                "Base address " + std::to_string(base) + " leaves no room for the record terminator");
  }

  const bool lenient = options.recovery == RecoveryMode::LENIENT;
  const bool check_utf8 = options.validate_utf8 && leader.value.is_unicode();
  const size_t indicator_count = leader.value.indicator_count;
  // Field data may not overlap the record terminator
  const size_t data_end = size - 1;

  Record record(std::move(leader.value));

  // 4-5. Directory and fields
  size_t pos = LEADER_LENGTH;
  bool terminated = false;
  while (pos < base) {
    if (data[pos] == FIELD_TERMINATOR) {
      terminated = true;
      break;
    }
    if (pos + DIRECTORY_ENTRY_LENGTH > base) {
      if (lenient)
        break;
      return fail(ErrorCode::INVALID_DIRECTORY, pos, "Incomplete directory entry");
    }

    const uint8_t* entry = data + pos;
    const size_t entry_pos = pos;
    pos += DIRECTORY_ENTRY_LENGTH;

    if (!is_tag_byte(entry[0]) || !is_tag_byte(entry[1]) || !is_tag_byte(entry[2])) {
      if (lenient)
        continue;
      return fail(ErrorCode::INVALID_DIRECTORY, entry_pos, "Invalid tag in directory entry");
    }
    std::string tag(reinterpret_cast<const char*>(entry), 3);

    size_t field_length = 0;
    size_t field_start = 0;
    if (!parse_fixed_digits(entry + 3, 4, field_length) ||
        !parse_fixed_digits(entry + 7, 5, field_start)) {
      if (lenient)
        continue;
      return fail(ErrorCode::INVALID_DIRECTORY, entry_pos,
                  "Non-numeric length or start in directory entry for tag " + tag);
    }

    const size_t field_begin = base + field_start;
    if (field_begin > data_end || field_length > data_end - field_begin) {
      if (lenient)
        continue;
      return fail(ErrorCode::INVALID_FIELD, entry_pos,
                  "Field " + tag + " (start " + std::to_string(field_start) + ", length " +
                      std::to_string(field_length) + ") exceeds the data area");
    }
    const uint8_t* field = data + field_begin;

    if (check_utf8 &&
        !simdutf::validate_utf8(reinterpret_cast<const char*>(field), field_length)) {
      if (lenient)
        continue;
      return fail(ErrorCode::ENCODING_ERROR, field_begin,
                  "Field " + tag + " is not valid UTF-8");
    }

    if (is_control_tag(tag)) {
      size_t n = field_length;
      if (n > 0 && field[n - 1] == FIELD_TERMINATOR)
        --n;
      record.add_control_field(std::move(tag), std::string(reinterpret_cast<const char*>(field), n));
      continue;
    }

    Field parsed;
    size_t field_fault = 0;
    std::string message;
    if (!parse_data_field(field, field_length, std::move(tag), indicator_count, parsed, field_fault,
                          message)) {
      if (lenient)
        continue;
      return fail(ErrorCode::INVALID_FIELD, field_begin + field_fault, std::move(message));
    }
    record.add_field(std::move(parsed));
  }

  if (!terminated && !lenient) {
    return fail(ErrorCode::INVALID_DIRECTORY, base - 1, "Directory is not terminated");
  }

  // 6. Record terminator
  if (data[size - 1] != RECORD_TERMINATOR) {
    return fail(ErrorCode::MISSING_TERMINATOR, size - 1, "Record does not end with 0x1D");
  }

  return record;
}

} // namespace libmarc

#include "libmarc/leader.h"

#include <string>

namespace libmarc {

namespace {

bool is_digit(uint8_t c) {
  return c >= '0' && c <= '9';
}

// Parses count ASCII digits starting at pos; returns false on a non-digit.
bool parse_digits(const uint8_t* data, size_t pos, size_t count, uint32_t& out) {
  uint32_t value = 0;
  for (size_t i = 0; i < count; ++i) {
    if (!is_digit(data[pos + i]))
      return false;
    value = value * 10 + static_cast<uint32_t>(data[pos + i] - '0');
  }
  out = value;
  return true;
}

std::string zero_pad5(uint32_t value) {
  std::string digits = std::to_string(value);
  return std::string(5 - digits.size(), '0') + digits;
}

void set_fault(size_t* fault_position, size_t pos) {
  if (fault_position)
    *fault_position = pos;
}

} // namespace

Result<Leader> Leader::parse(const uint8_t* data, size_t size, size_t* fault_position) {
  if (size < LEADER_LENGTH) {
    set_fault(fault_position, size);
    return Result<Leader>::failure(
        "Leader must be 24 bytes, got " + std::to_string(size));
  }

  Leader leader;
  if (!parse_digits(data, 0, 5, leader.record_length)) {
    set_fault(fault_position, 0);
    return Result<Leader>::failure("Record length (positions 0-4) is not numeric");
  }
  leader.record_status = static_cast<char>(data[5]);
  leader.record_type = static_cast<char>(data[6]);
  leader.bibliographic_level = static_cast<char>(data[7]);
  leader.control_type = static_cast<char>(data[8]);
  leader.character_coding = static_cast<char>(data[9]);

  if (!is_digit(data[10])) {
    set_fault(fault_position, 10);
    return Result<Leader>::failure(
        std::string("Invalid indicator count at position 10: '") + static_cast<char>(data[10]) + "'");
  }
  leader.indicator_count = static_cast<uint8_t>(data[10] - '0');

  if (!is_digit(data[11])) {
    set_fault(fault_position, 11);
    return Result<Leader>::failure(std::string("Invalid subfield code count at position 11: '") +
                                     static_cast<char>(data[11]) + "'");
  }
  leader.subfield_code_count = static_cast<uint8_t>(data[11] - '0');

  if (!parse_digits(data, 12, 5, leader.data_base_address)) {
    set_fault(fault_position, 12);
    return Result<Leader>::failure("Base address of data (positions 12-16) is not numeric");
  }
  leader.encoding_level = static_cast<char>(data[17]);
  leader.cataloging_form = static_cast<char>(data[18]);
  leader.multipart_level = static_cast<char>(data[19]);
  leader.entry_map.assign(reinterpret_cast<const char*>(data + 20), 4);

  return Result<Leader>::success(std::move(leader));
}

Result<void> Leader::validate_for_reading(size_t* fault_position) const {
  if (record_length < LEADER_LENGTH) {
    set_fault(fault_position, 0);
    return Result<void>::failure(
        "Record length must be at least 24, got " + std::to_string(record_length));
  }
  if (data_base_address < LEADER_LENGTH) {
    set_fault(fault_position, 12);
    return Result<void>::failure("Base address of data must be at least 24, got " +
                                 std::to_string(data_base_address));
  }
  if (data_base_address > record_length) {
    set_fault(fault_position, 12);
    return Result<void>::failure("Base address of data " + std::to_string(data_base_address) +
                                 " lies beyond record length " + std::to_string(record_length));
  }
  if (indicator_count > 2) {
    set_fault(fault_position, 10);
    return Result<void>::failure(
        "Indicator count " + std::to_string(indicator_count) + " is not supported");
  }
  return Result<void>::success();
}

Result<std::string> Leader::to_bytes() const {
  if (record_length > MAX_RECORD_LENGTH || data_base_address > MAX_RECORD_LENGTH) {
    return Result<std::string>::failure(
        "Leader values do not fit: length " + std::to_string(record_length) + ", base address " +
        std::to_string(data_base_address));
  }
  if (indicator_count > 9 || subfield_code_count > 9) {
    return Result<std::string>::failure("Indicator or subfield code count exceeds one digit");
  }

  std::string out;
  out.reserve(LEADER_LENGTH);
  out += zero_pad5(record_length);
  out += record_status;
  out += record_type;
  out += bibliographic_level;
  out += control_type;
  out += character_coding;
  out += static_cast<char>('0' + indicator_count);
  out += static_cast<char>('0' + subfield_code_count);
  out += zero_pad5(data_base_address);
  out += encoding_level;
  out += cataloging_form;
  out += multipart_level;

  std::string map = entry_map;
  map.resize(4, '0');
  out += map;
  return Result<std::string>::success(std::move(out));
}

} // namespace libmarc

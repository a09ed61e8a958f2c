#include "libmarc/record_encoder.h"

#include <cstdint>

namespace libmarc {

namespace {

constexpr size_t MAX_FIELD_LENGTH = 9999;
constexpr size_t MAX_FIELD_START = 99999;

void append_padded(std::string& out, size_t value, size_t width) {
  std::string digits = std::to_string(value);
  if (digits.size() < width)
    out.append(width - digits.size(), '0');
  out += digits;
}

void append_field_body(std::string& data, const Field& field, size_t indicator_count) {
  if (indicator_count >= 1)
    data += field.indicator1;
  if (indicator_count >= 2)
    data += field.indicator2;
  for (const auto& sf : field.subfields) {
    data += static_cast<char>(SUBFIELD_DELIMITER);
    data += sf.code;
    data += sf.value;
  }
  data += static_cast<char>(FIELD_TERMINATOR);
}

} // namespace

Result<std::string> encode_record(const Record& record) {
  const size_t indicator_count = record.leader().indicator_count;

  std::string directory;
  std::string data;
  directory.reserve(record.size() * DIRECTORY_ENTRY_LENGTH + 1);

  for (const auto& entry : record.entries()) {
    const std::string& tag = entry_tag(entry);
    if (tag.size() != 3) {
      return Result<std::string>::failure("Tag '" + tag + "' is not three characters");
    }

    const size_t start = data.size();
    if (const auto* cf = std::get_if<ControlField>(&entry)) {
      data += cf->value;
      data += static_cast<char>(FIELD_TERMINATOR);
    } else {
      append_field_body(data, std::get<Field>(entry), indicator_count);
    }
    const size_t length = data.size() - start;

    if (length > MAX_FIELD_LENGTH) {
      return Result<std::string>::failure("Field " + tag + " is " + std::to_string(length) +
                                          " bytes, longer than a directory entry can describe");
    }
    if (start > MAX_FIELD_START) {
      return Result<std::string>::failure("Field " + tag + " starts beyond offset 99999");
    }

    directory += tag;
    append_padded(directory, length, 4);
    append_padded(directory, start, 5);
  }
  directory += static_cast<char>(FIELD_TERMINATOR);

  const size_t base_address = LEADER_LENGTH + directory.size();
  const size_t record_length = base_address + data.size() + 1;
  if (record_length > MAX_RECORD_LENGTH) {
    return Result<std::string>::failure("Record length " + std::to_string(record_length) +
                                        " exceeds 99999 bytes");
  }

  Leader leader = record.leader();
  leader.record_length = static_cast<uint32_t>(record_length);
  leader.data_base_address = static_cast<uint32_t>(base_address);
  auto leader_bytes = leader.to_bytes();
  if (!leader_bytes) {
    return Result<std::string>::failure(leader_bytes.error);
  }

  std::string out;
  out.reserve(record_length);
  out += leader_bytes.value;
  out += directory;
  out += data;
  out += static_cast<char>(RECORD_TERMINATOR);
  return Result<std::string>::success(std::move(out));
}

Result<std::string> encode_records(const std::vector<Record>& records) {
  std::string out;
  for (size_t i = 0; i < records.size(); ++i) {
    auto encoded = encode_record(records[i]);
    if (!encoded) {
      return Result<std::string>::failure("Record " + std::to_string(i) + ": " + encoded.error);
    }
    out += encoded.value;
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace libmarc

#pragma once

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace libmarc {

// The fixed 24-byte header that opens every record.
//
// Positions:
//   0-4   record length (ASCII digits)
//   5     record status
//   6     type of record
//   7     bibliographic level
//   8     type of control
//   9     character coding scheme (' ' = MARC-8, 'a' = UCS/Unicode)
//   10    indicator count (digit)
//   11    subfield code count (digit)
//   12-16 base address of data (ASCII digits)
//   17    encoding level
//   18    descriptive cataloging form
//   19    multipart resource record level
//   20-23 entry map
struct Leader {
  uint32_t record_length = 0;
  char record_status = 'n';
  char record_type = 'a';
  char bibliographic_level = 'm';
  char control_type = ' ';
  char character_coding = 'a';
  uint8_t indicator_count = 2;
  uint8_t subfield_code_count = 2;
  uint32_t data_base_address = 0;
  char encoding_level = ' ';
  char cataloging_form = 'a';
  char multipart_level = ' ';
  std::string entry_map = "4500";

  // Parse the first 24 bytes of data. On failure, fault_position (if given)
  // receives the leader position that failed.
  static Result<Leader> parse(const uint8_t* data, size_t size, size_t* fault_position = nullptr);

  // Checks required before a record body can be located: record length and
  // base address both cover at least the leader, and the widths are usable.
  Result<void> validate_for_reading(size_t* fault_position = nullptr) const;

  // Exactly 24 bytes. Fails if a numeric position does not fit its width.
  Result<std::string> to_bytes() const;

  bool is_unicode() const { return character_coding == 'a'; }

  bool operator==(const Leader& other) const = default;
};

} // namespace libmarc

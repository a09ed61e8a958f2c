#pragma once

#include "record.h"
#include "types.h"

#include <string>
#include <vector>

namespace libmarc {

// Serialize a record to ISO 2709. Fields are written in the record's stored
// order; the directory, base address and record length are recomputed, so the
// leader's own length fields are ignored.
//
// Fails if a tag is not three characters, a field or start offset does not
// fit its directory width, or the record exceeds 99999 bytes.
Result<std::string> encode_record(const Record& record);

// Concatenation of encode_record() over records. Stops at the first failure,
// naming the record index in the error.
Result<std::string> encode_records(const std::vector<Record>& records);

} // namespace libmarc

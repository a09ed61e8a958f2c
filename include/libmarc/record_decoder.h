#pragma once

#include "error.h"
#include "options.h"
#include "record.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

namespace libmarc {

/// Outcome of decoding one record span.
using DecodeResult = std::variant<Record, ParseError>;

inline bool is_record(const DecodeResult& result) {
  return std::holds_alternative<Record>(result);
}

inline bool is_error(const DecodeResult& result) {
  return std::holds_alternative<ParseError>(result);
}

/**
 * @brief Decode one ISO 2709 record.
 *
 * The span must cover exactly one record: five-digit length header through
 * the record terminator. Every fault is returned as a ParseError; no input
 * causes an exception or a read outside the span.
 *
 * Checks run in order: length header, declared vs. actual length, leader,
 * directory, fields, record terminator.
 *
 * The function touches no shared state and is safe to call concurrently.
 *
 * @param data Pointer to the first byte of the record
 * @param size Number of bytes in the span
 * @param options Recovery mode and UTF-8 validation
 * @param base_offset Added to every reported byte offset, normally the
 *        record's position in the stream
 */
DecodeResult decode_record(const uint8_t* data, size_t size, const DecodeOptions& options = {},
                           size_t base_offset = 0);

inline DecodeResult decode_record(std::string_view bytes, const DecodeOptions& options = {}) {
  return decode_record(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), options, 0);
}

// Reads the five-digit length header. Returns 0 if the bytes are not all
// digits; the caller must supply at least LENGTH_HEADER_DIGITS bytes.
size_t parse_length_header(const uint8_t* data);

// MAX_RECORD_LENGTH bytes with no record terminator can never belong to a
// record. Readers cut such runs off the front of a span, report each one
// with this error at its stream offset, and carry on after it.
ParseError unterminated_run_error(size_t offset);

} // namespace libmarc

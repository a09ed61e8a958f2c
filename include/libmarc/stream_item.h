#pragma once

#include "error.h"
#include "record.h"
#include "record_decoder.h"

#include <utility>
#include <variant>

namespace libmarc {

/// One result from a record stream: a record, a per-record error, the
/// terminal stream error, or the exhausted sentinel. Once a reader returns
/// exhausted it returns exhausted on every later call.
class StreamItem {
public:
  struct Exhausted {
    bool operator==(const Exhausted&) const = default;
  };

  StreamItem() = default;

  static StreamItem exhausted() { return StreamItem(); }
  static StreamItem from(DecodeResult&& result) {
    if (auto* record = std::get_if<Record>(&result))
      return StreamItem(std::move(*record));
    return StreamItem(std::move(std::get<ParseError>(result)));
  }

  explicit StreamItem(Record record) : value_(std::move(record)) {}
  explicit StreamItem(ParseError error) : value_(std::move(error)) {}
  explicit StreamItem(StreamError error) : value_(std::move(error)) {}

  bool is_exhausted() const { return std::holds_alternative<Exhausted>(value_); }
  bool is_record() const { return std::holds_alternative<Record>(value_); }
  bool is_parse_error() const { return std::holds_alternative<ParseError>(value_); }
  bool is_stream_error() const { return std::holds_alternative<StreamError>(value_); }

  const Record& record() const { return std::get<Record>(value_); }
  Record take_record() { return std::move(std::get<Record>(value_)); }
  const ParseError& parse_error() const { return std::get<ParseError>(value_); }
  const StreamError& stream_error() const { return std::get<StreamError>(value_); }

private:
  std::variant<Exhausted, Record, ParseError, StreamError> value_;
};

} // namespace libmarc

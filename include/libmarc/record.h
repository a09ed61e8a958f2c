#pragma once

#include "leader.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace libmarc {

struct Subfield {
  char code = 'a';
  std::string value;

  bool operator==(const Subfield& other) const = default;
};

// Variable data field: indicators plus an ordered list of subfields.
struct Field {
  std::string tag;
  char indicator1 = ' ';
  char indicator2 = ' ';
  std::vector<Subfield> subfields;

  Field() = default;
  Field(std::string t, char ind1, char ind2) : tag(std::move(t)), indicator1(ind1), indicator2(ind2) {}

  Field& add_subfield(char code, std::string value) {
    subfields.push_back({code, std::move(value)});
    return *this;
  }

  // First subfield with the given code, empty view if none
  std::string_view subfield(char code) const;
  bool has_subfield(char code) const;
  std::vector<std::string_view> subfield_values(char code) const;

  bool operator==(const Field& other) const = default;
};

// Control field (tags 001-009): a raw value with no indicators or subfields.
struct ControlField {
  std::string tag;
  std::string value;

  bool operator==(const ControlField& other) const = default;
};

using FieldEntry = std::variant<ControlField, Field>;

/**
 * @brief One decoded bibliographic record.
 *
 * Fields are kept in a single sequence in directory order, so the relative
 * order of control fields, data fields and repeated tags all survive a
 * decode/encode cycle. Lookups by tag scan that sequence.
 */
class Record {
public:
  Record() = default;
  explicit Record(Leader leader) : leader_(std::move(leader)) {}

  const Leader& leader() const { return leader_; }
  Leader& leader() { return leader_; }

  void add_control_field(std::string tag, std::string value);
  void add_field(Field field);

  // All fields in directory order
  const std::vector<FieldEntry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Tags in directory order, duplicates included
  std::vector<std::string> tags() const;

  // First control field with this tag, empty view if none
  std::string_view control_field(std::string_view tag) const;
  bool has_control_field(std::string_view tag) const;
  std::vector<ControlField> control_fields() const;

  // Data fields with this tag, in order
  std::vector<const Field*> fields(std::string_view tag) const;
  // First data field with this tag, or nullptr
  const Field* field(std::string_view tag) const;
  std::vector<const Field*> data_fields() const;

  bool operator==(const Record& other) const = default;

private:
  Leader leader_;
  std::vector<FieldEntry> entries_;
};

inline const std::string& entry_tag(const FieldEntry& entry) {
  return std::visit([](const auto& f) -> const std::string& { return f.tag; }, entry);
}

} // namespace libmarc

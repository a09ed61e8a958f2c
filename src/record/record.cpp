#include "libmarc/record.h"

namespace libmarc {

std::string_view Field::subfield(char code) const {
  for (const auto& sf : subfields) {
    if (sf.code == code)
      return sf.value;
  }
  return {};
}

bool Field::has_subfield(char code) const {
  for (const auto& sf : subfields) {
    if (sf.code == code)
      return true;
  }
  return false;
}

std::vector<std::string_view> Field::subfield_values(char code) const {
  std::vector<std::string_view> values;
  for (const auto& sf : subfields) {
    if (sf.code == code)
      values.push_back(sf.value);
  }
  return values;
}

void Record::add_control_field(std::string tag, std::string value) {
  entries_.emplace_back(ControlField{std::move(tag), std::move(value)});
}

void Record::add_field(Field field) {
  entries_.emplace_back(std::move(field));
}

std::vector<std::string> Record::tags() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(entry_tag(entry));
  }
  return out;
}

std::string_view Record::control_field(std::string_view tag) const {
  for (const auto& entry : entries_) {
    if (const auto* cf = std::get_if<ControlField>(&entry); cf && cf->tag == tag)
      return cf->value;
  }
  return {};
}

bool Record::has_control_field(std::string_view tag) const {
  for (const auto& entry : entries_) {
    if (const auto* cf = std::get_if<ControlField>(&entry); cf && cf->tag == tag)
      return true;
  }
  return false;
}

std::vector<ControlField> Record::control_fields() const {
  std::vector<ControlField> out;
  for (const auto& entry : entries_) {
    if (const auto* cf = std::get_if<ControlField>(&entry))
      out.push_back(*cf);
  }
  return out;
}

std::vector<const Field*> Record::fields(std::string_view tag) const {
  std::vector<const Field*> out;
  for (const auto& entry : entries_) {
    if (const auto* f = std::get_if<Field>(&entry); f && f->tag == tag)
      out.push_back(f);
  }
  return out;
}

const Field* Record::field(std::string_view tag) const {
  for (const auto& entry : entries_) {
    if (const auto* f = std::get_if<Field>(&entry); f && f->tag == tag)
      return f;
  }
  return nullptr;
}

std::vector<const Field*> Record::data_fields() const {
  std::vector<const Field*> out;
  for (const auto& entry : entries_) {
    if (const auto* f = std::get_if<Field>(&entry))
      out.push_back(f);
  }
  return out;
}

} // namespace libmarc

#pragma once

#include "libmarc.h"

#include <cstddef>
#include <map>
#include <string>

// Encoded streams shared by all benchmarks, keyed by record count
extern std::map<size_t, std::string> stream_cache;

namespace bench {

// A record shaped like a typical catalog entry: a few control fields and a
// dozen data fields with two or three subfields each.
inline libmarc::Record catalog_record(size_t id) {
  libmarc::Record record;
  record.add_control_field("001", "ocm" + std::to_string(100000 + id));
  record.add_control_field("003", "OCoLC");
  record.add_control_field("005", "20240101120000.0");
  record.add_control_field("008", "240101s2024    nyu           000 0 eng d");

  libmarc::Field isbn("020", ' ', ' ');
  isbn.add_subfield('a', "978" + std::to_string(1000000000 + id)).add_subfield('q', "hardcover");
  record.add_field(std::move(isbn));

  libmarc::Field author("100", '1', ' ');
  author.add_subfield('a', "Author, Example " + std::to_string(id % 997) + ",")
      .add_subfield('d', "1950-");
  record.add_field(std::move(author));

  libmarc::Field title("245", '1', '0');
  title.add_subfield('a', "Collected works on subject number " + std::to_string(id) + " :")
      .add_subfield('b', "an annotated survey /")
      .add_subfield('c', "edited by Example Author.");
  record.add_field(std::move(title));

  libmarc::Field imprint("264", ' ', '1');
  imprint.add_subfield('a', "New York :").add_subfield('b', "Example Press,").add_subfield('c', "2024.");
  record.add_field(std::move(imprint));

  libmarc::Field extent("300", ' ', ' ');
  extent.add_subfield('a', "xii, 345 pages :").add_subfield('b', "illustrations ;").add_subfield('c', "24 cm");
  record.add_field(std::move(extent));

  for (int i = 0; i < 6; ++i) {
    libmarc::Field subject("650", ' ', '0');
    subject.add_subfield('a', "Topic " + std::to_string((id + i) % 211))
        .add_subfield('x', "History")
        .add_subfield('y', "20th century.");
    record.add_field(std::move(subject));
  }
  return record;
}

inline std::string make_stream(size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    auto encoded = libmarc::encode_record(catalog_record(i));
    if (encoded.ok)
      out += encoded.value;
  }
  return out;
}

inline const std::string& cached_stream(size_t count) {
  auto it = stream_cache.find(count);
  if (it == stream_cache.end())
    it = stream_cache.emplace(count, make_stream(count)).first;
  return it->second;
}

} // namespace bench

/**
 * @file fuzz_record_decoder.cpp
 * @brief LibFuzzer target for the record decoder and boundary scanner.
 */

#include "libmarc/boundary_scanner.h"
#include "libmarc/record_decoder.h"
#include "libmarc/record_encoder.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  // 256KB: a few maximum-size records, enough to cross many 64-byte lanes
  constexpr size_t MAX_INPUT_SIZE = 256 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  // Copy so out-of-bounds reads past size are caught by ASan
  std::vector<uint8_t> buf(data, data + size);
  const uint8_t* bytes = buf.empty() ? nullptr : buf.data();

  // SIMD and scalar scanners must agree
  auto simd = libmarc::scan_boundaries(bytes, size);
  auto scalar = libmarc::scan_boundaries_scalar(bytes, size);
  if (simd != scalar || libmarc::count_records(bytes, size) != scalar.size())
    std::abort();

  libmarc::DecodeOptions strict;
  libmarc::DecodeOptions lenient;
  lenient.recovery = libmarc::RecoveryMode::LENIENT;

  for (const auto& b : simd) {
    auto result = libmarc::decode_record(bytes + b.offset, b.length, strict, b.offset);
    libmarc::decode_record(bytes + b.offset, b.length, lenient, b.offset);

    // A record that decodes strictly must survive re-encoding
    if (libmarc::is_record(result)) {
      auto encoded = libmarc::encode_record(std::get<libmarc::Record>(result));
      if (encoded.ok) {
        auto again = libmarc::decode_record(encoded.value, strict);
        if (!libmarc::is_record(again) ||
            std::get<libmarc::Record>(again).entries() !=
                std::get<libmarc::Record>(result).entries())
          std::abort();
      }
    }
  }

  // The whole input as one span exercises the length checks
  if (size > 0) {
    libmarc::decode_record(bytes, size, strict, 0);
    libmarc::decode_record(bytes, size, lenient, 0);
  }
  return 0;
}

/**
 * @file leader_test.cpp
 * @brief Tests for Leader parsing, validation and serialization.
 */

#include "test_util.h"

#include <gtest/gtest.h>
#include <string>

using libmarc::Leader;

namespace {

Leader parse_ok(const std::string& bytes) {
  auto result = Leader::parse(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
  EXPECT_TRUE(result.ok) << result.error;
  return result.value;
}

} // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST(LeaderTest, ParsesAllPositions) {
  Leader leader = parse_ok("01234cam a2200289 i 4500");
  EXPECT_EQ(leader.record_length, 1234u);
  EXPECT_EQ(leader.record_status, 'c');
  EXPECT_EQ(leader.record_type, 'a');
  EXPECT_EQ(leader.bibliographic_level, 'm');
  EXPECT_EQ(leader.control_type, ' ');
  EXPECT_EQ(leader.character_coding, 'a');
  EXPECT_EQ(leader.indicator_count, 2);
  EXPECT_EQ(leader.subfield_code_count, 2);
  EXPECT_EQ(leader.data_base_address, 289u);
  EXPECT_EQ(leader.encoding_level, ' ');
  EXPECT_EQ(leader.cataloging_form, 'i');
  EXPECT_EQ(leader.multipart_level, ' ');
  EXPECT_EQ(leader.entry_map, "4500");
  EXPECT_TRUE(leader.is_unicode());
}

TEST(LeaderTest, Marc8CodingIsNotUnicode) {
  Leader leader = parse_ok("00100nam  2200049   4500");
  EXPECT_EQ(leader.character_coding, ' ');
  EXPECT_FALSE(leader.is_unicode());
}

TEST(LeaderTest, ShortInputFails) {
  std::string bytes = "00026nam a22";
  size_t fault = 99;
  auto result = Leader::parse(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), &fault);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(fault, bytes.size());
}

TEST(LeaderTest, NonNumericFieldsReportTheirPosition) {
  struct Case {
    std::string bytes;
    size_t position;
  };
  const Case cases[] = {
      {"0x026nam a2200025 a 4500", 0},
      {"00026nam aX200025 a 4500", 10},
      {"00026nam a2X00025 a 4500", 11},
      {"00026nam a22000x5 a 4500", 12},
  };
  for (const auto& c : cases) {
    size_t fault = 99;
    auto result =
        Leader::parse(reinterpret_cast<const uint8_t*>(c.bytes.data()), c.bytes.size(), &fault);
    EXPECT_FALSE(result.ok) << c.bytes;
    EXPECT_EQ(fault, c.position) << c.bytes;
  }
}

// =============================================================================
// Validation
// =============================================================================

TEST(LeaderTest, ValidateAcceptsMinimalRecord) {
  Leader leader = parse_ok(test_util::minimal_record().substr(0, 24));
  EXPECT_TRUE(leader.validate_for_reading().ok);
}

TEST(LeaderTest, ValidateRejectsSmallBaseAddress) {
  Leader leader = parse_ok("00026nam a2200010 a 4500");
  size_t fault = 0;
  auto result = leader.validate_for_reading(&fault);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(fault, 12u);
}

TEST(LeaderTest, ValidateRejectsBaseBeyondLength) {
  Leader leader = parse_ok("00030nam a2200040 a 4500");
  EXPECT_FALSE(leader.validate_for_reading().ok);
}

TEST(LeaderTest, ValidateRejectsShortRecordLength) {
  Leader leader = parse_ok("00020nam a2200024 a 4500");
  size_t fault = 99;
  EXPECT_FALSE(leader.validate_for_reading(&fault).ok);
  EXPECT_EQ(fault, 0u);
}

TEST(LeaderTest, ValidateRejectsWideIndicators) {
  Leader leader = parse_ok("00026nam a3200025 a 4500");
  size_t fault = 0;
  EXPECT_FALSE(leader.validate_for_reading(&fault).ok);
  EXPECT_EQ(fault, 10u);
}

// =============================================================================
// Serialization
// =============================================================================

TEST(LeaderTest, ToBytesReproducesParsedLeader) {
  const std::string original = "01234cam a2200289 i 4500";
  auto bytes = parse_ok(original).to_bytes();
  ASSERT_TRUE(bytes.ok) << bytes.error;
  EXPECT_EQ(bytes.value, original);
}

TEST(LeaderTest, ToBytesZeroPadsNumbers) {
  Leader leader;
  leader.record_length = 42;
  leader.data_base_address = 25;
  auto bytes = leader.to_bytes();
  ASSERT_TRUE(bytes.ok);
  ASSERT_EQ(bytes.value.size(), libmarc::LEADER_LENGTH);
  EXPECT_EQ(bytes.value.substr(0, 5), "00042");
  EXPECT_EQ(bytes.value.substr(12, 5), "00025");
}

TEST(LeaderTest, ToBytesRejectsOversizedLength) {
  Leader leader;
  leader.record_length = 100000;
  EXPECT_FALSE(leader.to_bytes().ok);
}

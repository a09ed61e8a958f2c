/**
 * @file record_test.cpp
 * @brief Tests for the in-memory record model and its tag lookups.
 */

#include "test_util.h"

#include <gtest/gtest.h>

using libmarc::ControlField;
using libmarc::Field;
using libmarc::Record;

TEST(RecordTest, EmptyRecord) {
  Record record;
  EXPECT_TRUE(record.empty());
  EXPECT_EQ(record.size(), 0u);
  EXPECT_TRUE(record.tags().empty());
  EXPECT_EQ(record.field("245"), nullptr);
  EXPECT_TRUE(record.control_field("001").empty());
}

TEST(RecordTest, KeepsInterleavedOrder) {
  Record record = test_util::sample_record(7);
  std::vector<std::string> expected = {"001", "245", "650", "001"};
  EXPECT_EQ(record.tags(), expected);
  EXPECT_EQ(record.size(), 4u);
}

TEST(RecordTest, ControlFieldLookupReturnsFirst) {
  Record record = test_util::sample_record(7);
  EXPECT_TRUE(record.has_control_field("001"));
  EXPECT_FALSE(record.has_control_field("008"));
  EXPECT_EQ(record.control_field("001"), "ocm7");

  auto controls = record.control_fields();
  ASSERT_EQ(controls.size(), 2u);
  EXPECT_EQ(controls[1], (ControlField{"001", "second-7"}));
}

TEST(RecordTest, DataFieldLookups) {
  Record record = test_util::sample_record(3);
  const Field* title = record.field("245");
  ASSERT_NE(title, nullptr);
  EXPECT_EQ(title->indicator1, '1');
  EXPECT_EQ(title->indicator2, '0');
  EXPECT_EQ(title->subfield('a'), "The title 3");
  EXPECT_TRUE(title->has_subfield('c'));
  EXPECT_FALSE(title->has_subfield('z'));
  EXPECT_TRUE(title->subfield('z').empty());

  EXPECT_EQ(record.data_fields().size(), 2u);
  EXPECT_TRUE(record.fields("100").empty());
}

TEST(RecordTest, RepeatedTagsAndSubfields) {
  Record record;
  Field first("650", ' ', '0');
  first.add_subfield('a', "One").add_subfield('x', "A").add_subfield('x', "B");
  record.add_field(first);
  Field second("650", ' ', '7');
  second.add_subfield('a', "Two");
  record.add_field(second);

  auto subjects = record.fields("650");
  ASSERT_EQ(subjects.size(), 2u);
  EXPECT_EQ(subjects[0]->subfield('a'), "One");
  EXPECT_EQ(subjects[1]->subfield('a'), "Two");

  auto xs = subjects[0]->subfield_values('x');
  ASSERT_EQ(xs.size(), 2u);
  EXPECT_EQ(xs[0], "A");
  EXPECT_EQ(xs[1], "B");
}

TEST(RecordTest, EntryTagCoversBothKinds) {
  Record record = test_util::sample_record();
  const auto& entries = record.entries();
  EXPECT_TRUE(std::holds_alternative<ControlField>(entries[0]));
  EXPECT_TRUE(std::holds_alternative<Field>(entries[1]));
  EXPECT_EQ(libmarc::entry_tag(entries[0]), "001");
  EXPECT_EQ(libmarc::entry_tag(entries[2]), "650");
}

TEST(RecordTest, ControlTagRange) {
  EXPECT_TRUE(libmarc::is_control_tag("001"));
  EXPECT_TRUE(libmarc::is_control_tag("009"));
  EXPECT_FALSE(libmarc::is_control_tag("000"));
  EXPECT_FALSE(libmarc::is_control_tag("010"));
  EXPECT_FALSE(libmarc::is_control_tag("245"));
  EXPECT_FALSE(libmarc::is_control_tag("01"));
}

TEST(RecordTest, Equality) {
  EXPECT_EQ(test_util::sample_record(1), test_util::sample_record(1));
  EXPECT_NE(test_util::sample_record(1), test_util::sample_record(2));
}

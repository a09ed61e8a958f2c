/**
 * @file mmap_source_test.cpp
 * @brief Tests for MmapSource memory-mapped file I/O.
 *
 * Tests open, close, content integrity, empty files, error handling,
 * move semantics and reopen behavior.
 */

#include "test_util.h"

#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

using libmarc::MmapSource;
using test_util::TempFile;

class MmapSourceTest : public ::testing::Test {
protected:
  void SetUp() override { records_ = test_util::make_stream(20); }

  std::string records_;
};

// =============================================================================
// Open and basic state tests
// =============================================================================

TEST_F(MmapSourceTest, DefaultStateNotOpen) {
  MmapSource source;
  EXPECT_FALSE(source.is_open());
  EXPECT_EQ(source.size(), 0u);
  EXPECT_EQ(source.data(), nullptr);
}

TEST_F(MmapSourceTest, OpenValidFile) {
  TempFile file(records_);
  MmapSource source;
  auto result = source.open(file.path());
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_TRUE(source.is_open());
  EXPECT_EQ(source.size(), records_.size());
  EXPECT_NE(source.data(), nullptr);
}

TEST_F(MmapSourceTest, OpenNonExistentFile) {
  MmapSource source;
  auto result = source.open("/tmp/libmarc_file_that_does_not_exist.mrc");
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(source.is_open());
}

TEST_F(MmapSourceTest, OpenDirectoryFails) {
  MmapSource source;
  auto result = source.open(std::filesystem::temp_directory_path().string());
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(source.is_open());
}

// =============================================================================
// Content integrity tests
// =============================================================================

TEST_F(MmapSourceTest, ContentMatchesFile) {
  TempFile file(records_);
  MmapSource source;
  ASSERT_TRUE(source.open(file.path()).ok);
  ASSERT_EQ(source.size(), records_.size());
  EXPECT_EQ(std::memcmp(source.data(), records_.data(), records_.size()), 0);
  EXPECT_EQ(source.bytes().size(), records_.size());
}

TEST_F(MmapSourceTest, EmptyFile) {
  TempFile file("");
  MmapSource source;
  auto result = source.open(file.path());
  ASSERT_TRUE(result.ok);
  EXPECT_TRUE(source.is_open());
  EXPECT_EQ(source.size(), 0u);
}

// =============================================================================
// Close and lifecycle tests
// =============================================================================

TEST_F(MmapSourceTest, CloseReleasesResources) {
  TempFile file(records_);
  MmapSource source;
  ASSERT_TRUE(source.open(file.path()).ok);
  source.close();
  EXPECT_FALSE(source.is_open());
  EXPECT_EQ(source.size(), 0u);

  source.close(); // Double close is a no-op
  EXPECT_FALSE(source.is_open());
}

TEST_F(MmapSourceTest, ReopenDifferentFile) {
  TempFile first(records_);
  TempFile second(test_util::minimal_record());

  MmapSource source;
  ASSERT_TRUE(source.open(first.path()).ok);
  ASSERT_TRUE(source.open(second.path()).ok);
  EXPECT_TRUE(source.is_open());
  EXPECT_EQ(source.size(), 26u);
}

TEST_F(MmapSourceTest, MoveTransfersMapping) {
  TempFile file(records_);
  MmapSource a;
  ASSERT_TRUE(a.open(file.path()).ok);
  const uint8_t* mapped = a.data();

  MmapSource b(std::move(a));
  EXPECT_TRUE(b.is_open());
  EXPECT_EQ(b.data(), mapped);
  EXPECT_FALSE(a.is_open());

  MmapSource c;
  c = std::move(b);
  EXPECT_EQ(c.data(), mapped);
  EXPECT_EQ(c.size(), records_.size());
}

TEST_F(MmapSourceTest, MappedRecordsDecode) {
  TempFile file(records_);
  MmapSource source;
  ASSERT_TRUE(source.open(file.path()).ok);
  auto boundaries = libmarc::scan_boundaries(source.data(), source.size());
  ASSERT_EQ(boundaries.size(), 20u);
  auto result = libmarc::decode_record(source.data() + boundaries[5].offset, boundaries[5].length);
  ASSERT_TRUE(libmarc::is_record(result));
  EXPECT_EQ(std::get<libmarc::Record>(result).control_field("001"), "ocm5");
}

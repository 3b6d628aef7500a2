#include "taskq/scanner/fingerprint.hpp"
#include "taskq/scanner/scanner.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace taskq;
namespace fs = std::filesystem;

TEST(TaskIdTest, AcceptsCanonicalIds) {
  EXPECT_TRUE(is_valid_task_id("task-20250101-120000"));
  EXPECT_TRUE(is_valid_task_id("task-20250101-120000-fix-login"));
  EXPECT_TRUE(is_valid_task_id("task-20241231-235959-a"));
}

TEST(TaskIdTest, RejectsMalformedIds) {
  EXPECT_FALSE(is_valid_task_id(""));
  EXPECT_FALSE(is_valid_task_id("task-"));
  EXPECT_FALSE(is_valid_task_id("task-20250101"));
  EXPECT_FALSE(is_valid_task_id("task-2025010-120000"));
  EXPECT_FALSE(is_valid_task_id("task-20250101-12000"));
  EXPECT_FALSE(is_valid_task_id("task-2025o101-120000"));
  EXPECT_FALSE(is_valid_task_id("job-20250101-120000"));
  EXPECT_FALSE(is_valid_task_id("Task-20250101-120000"));
}

class DirectoryScannerTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = test::make_temp_dir("taskq_scan_test"); }
  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
  SourceId source_{"main"};
};

TEST_F(DirectoryScannerTest, ScanIsSortedAndFiltered) {
  test::write_file(dir_ / "task-20250102-090000.md", "b");
  test::write_file(dir_ / "task-20250101-120000-first.md", "a");
  test::write_file(dir_ / "notes.md", "ignored");
  test::write_file(dir_ / "task-bogus.md", "ignored");
  test::write_file(dir_ / "task-20250101-120000.txt", "wrong extension");
  test::write_file(dir_ / ".task-20250101-120000.running", "{}");
  fs::create_directories(dir_ / "task-20250103-000000.md");

  DirectoryScanner scanner;
  auto found = scanner.scan(dir_, source_);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(found->size(), 2u);
  EXPECT_EQ((*found)[0].id, "task-20250101-120000-first");
  EXPECT_EQ((*found)[1].id, "task-20250102-090000");
  EXPECT_EQ((*found)[0].source_id, source_);
  EXPECT_EQ((*found)[0].file_size, 1u);
  EXPECT_EQ((*found)[0].spec_path, dir_ / "task-20250101-120000-first.md");
}

TEST_F(DirectoryScannerTest, MissingDirectoryIsReported) {
  DirectoryScanner scanner;
  auto found = scanner.scan(dir_ / "absent", source_);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error(), make_error_code(Error::FileNotFound));
}

TEST_F(DirectoryScannerTest, EmptyDirectoryYieldsNothing) {
  DirectoryScanner scanner;
  auto found = scanner.scan(dir_, source_);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->empty());
}

TEST_F(DirectoryScannerTest, EmptyFileHasNoFingerprint) {
  test::write_file(dir_ / "task-20250101-120000.md", "");
  DirectoryScanner scanner;
  auto task = scanner.inspect(dir_ / "task-20250101-120000.md", source_);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->file_size, 0u);
  EXPECT_FALSE(task->fingerprint.has_value());
}

TEST_F(DirectoryScannerTest, FingerprintDisabled) {
  test::write_file(dir_ / "task-20250101-120000.md", "content");
  DirectoryScanner scanner{ScannerOptions{.enable_fingerprint = false}};
  auto task = scanner.inspect(dir_ / "task-20250101-120000.md", source_);
  ASSERT_TRUE(task.has_value());
  EXPECT_FALSE(task->fingerprint.has_value());
  EXPECT_FALSE(scanner.is_modified(task->spec_path, std::nullopt));
}

TEST_F(DirectoryScannerTest, DetectsModification) {
  const auto file = test::write_file(dir_ / "task-20250101-120000.md", "v1");
  DirectoryScanner scanner;
  auto task = scanner.inspect(file, source_);
  ASSERT_TRUE(task.has_value());
  ASSERT_TRUE(task->fingerprint.has_value());

  EXPECT_FALSE(scanner.is_modified(file, task->fingerprint));
  EXPECT_TRUE(scanner.is_modified(file, std::nullopt));

  test::write_file(file, "v2");
  EXPECT_TRUE(scanner.is_modified(file, task->fingerprint));
}

TEST_F(DirectoryScannerTest, CustomPatterns) {
  test::write_file(dir_ / "task-20250101-120000.md", "a");
  test::write_file(dir_ / "task-20250101-130000.txt", "b");
  DirectoryScanner scanner{ScannerOptions{.patterns = {"task-*.txt"}}};
  auto found = scanner.scan(dir_, source_);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(found->size(), 1u);
  EXPECT_EQ(found->front().id, "task-20250101-130000");
}

TEST_F(DirectoryScannerTest, PatternDoesNotMatchHiddenFiles) {
  DirectoryScanner scanner{ScannerOptions{.patterns = {"*.md"}}};
  EXPECT_TRUE(scanner.matches_pattern("task-20250101-120000.md"));
  EXPECT_FALSE(scanner.matches_pattern(".task-20250101-120000.md"));
}

TEST_F(DirectoryScannerTest, FingerprintIsMd5Hex) {
  const auto file = test::write_file(dir_ / "f.txt", "hello");
  auto digest = file_fingerprint(file);
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(*digest, "5d41402abc4b2a76b9719d911017c592");
}

TEST_F(DirectoryScannerTest, FingerprintMissingFile) {
  auto digest = file_fingerprint(dir_ / "none");
  EXPECT_FALSE(digest.has_value());
}

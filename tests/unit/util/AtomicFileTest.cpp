/**
 * @file AtomicFileTest.cpp
 * @brief Unit tests for atomic replace and append-only writes
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "fixtures/TestFixtures.hpp"
#include "util/AtomicFile.hpp"

namespace fs = std::filesystem;

class AtomicFileTest : public TempDirFixture {};

TEST_F(AtomicFileTest, WriteFileAtomic_CreatesParentsAndReplacesContent) {
    const auto path = temp_dir / "nested" / "dir" / "state.json";

    ASSERT_TRUE(util::write_file_atomic(path, "first").has_value());
    ASSERT_TRUE(util::write_file_atomic(path, "second").has_value());

    auto content = util::read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "second");
}

// Test: no temporary files are left beside the target
TEST_F(AtomicFileTest, WriteFileAtomic_LeavesNoTemporaryFiles) {
    const auto path = temp_dir / "acked_alerts.json";
    ASSERT_TRUE(util::write_file_atomic(path, "[]").has_value());

    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(temp_dir)) {
        static_cast<void>(entry);
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(AtomicFileTest, WriteFileAtomic_FailsWhenParentIsAFile) {
    ASSERT_TRUE(util::write_file_atomic(temp_dir / "blocker", "x").has_value());

    auto result = util::write_file_atomic(temp_dir / "blocker" / "child.json", "{}");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PersistenceWriteFailed);
}

TEST_F(AtomicFileTest, AppendLine_AppendsWithNewline) {
    const auto path = temp_dir / "alerts.log";
    ASSERT_TRUE(util::append_line(path, "{\"id\":1}").has_value());
    ASSERT_TRUE(util::append_line(path, "{\"id\":2}").has_value());

    auto content = util::read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\"id\":1}\n{\"id\":2}\n");
}

TEST_F(AtomicFileTest, ReadFile_MissingFileIsNotFound) {
    auto result = util::read_file(temp_dir / "missing.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotFound);
}

#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <peek/content/directory_adapter.h>

#include "../../support/log_capture.hpp"
#include "../../support/temp_dir_scope.hpp"

using peek::ErrorCode;
using peek::content::DirectoryAdapter;
using peek::test_support::LogCapture;
using peek::test_support::TempDirScope;

TEST(DirectoryAdapterTest, ListsSortedNames) {
    auto dir = TempDirScope::unique_under("peek_dir_adapter");
    dir.write("b.txt", "b");
    dir.write("a.txt", "a");
    std::filesystem::create_directory(dir.path() / "c");

    auto names = DirectoryAdapter::listEntries(dir.path());
    ASSERT_TRUE(names);
    EXPECT_EQ(names.value(), (std::vector<std::string>{"a.txt", "b.txt", "c"}));

    auto content = DirectoryAdapter::buildContent(dir.path());
    ASSERT_TRUE(content);
    const auto& bytes = content.value();
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()),
              "a.txt\nb.txt\nc");
}

TEST(DirectoryAdapterTest, EmptyDirectory) {
    auto dir = TempDirScope::unique_under("peek_dir_empty");
    auto content = DirectoryAdapter::buildContent(dir.path());
    ASSERT_TRUE(content);
    EXPECT_TRUE(content.value().empty());
}

TEST(DirectoryAdapterTest, UnreadableDirectoryFails) {
    auto dir = TempDirScope::unique_under("peek_dir_missing");
    auto result = DirectoryAdapter::listEntries(dir.path() / "gone");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::DirectoryReadError);
}

TEST(DirectoryAdapterTest, LogsUnderComponentPrefix) {
    auto dir = TempDirScope::unique_under("peek_dir_log");
    dir.write("one.txt", "1");
    dir.write("two.txt", "2");

    LogCapture capture;
    ASSERT_TRUE(DirectoryAdapter::listEntries(dir.path()));
    EXPECT_TRUE(capture.anyStartsWith("[DirectoryAdapter] Listed 2 entries"));
}

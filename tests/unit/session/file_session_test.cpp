#include <algorithm>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <peek/content/hex_dump.h>
#include <peek/extraction/line_splitter.h>
#include <peek/session/file_session.h>

#include "../../support/temp_dir_scope.hpp"

using namespace peek::session;
using peek::ErrorCode;
using peek::detection::PathType;
using peek::test_support::TempDirScope;
using peek::test_support::toBytes;

namespace {

std::vector<std::string> allLines(const FileSession& session) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < session.getLineCount(); ++i) {
        lines.push_back(session.getLine(i).value_or("<missing>"));
    }
    return lines;
}

std::string manyLines(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        text += "entry " + std::to_string(i) + "\n";
    }
    return text;
}

} // namespace

class FileSessionTest : public ::testing::Test {
protected:
    TempDirScope dir_ = TempDirScope::unique_under("peek_session");
};

TEST_F(FileSessionTest, SmallUtf8FileLoadsSynchronously) {
    auto path = dir_.write("notes.txt", "Caf\xC3\xA9\nsecond line\n");

    FileSession session(path);
    ASSERT_TRUE(session.load());

    auto status = session.status();
    EXPECT_EQ(status.state, LoadState::SyncLoaded);
    EXPECT_TRUE(status.isFinal());
    EXPECT_FALSE(status.error.has_value());

    EXPECT_EQ(session.getLineCount(), 2u);
    EXPECT_EQ(session.getLine(0), "Caf\xC3\xA9");
    EXPECT_EQ(session.getContent(), "Caf\xC3\xA9\nsecond line");
    EXPECT_EQ(session.encoding(), "UTF-8");
}

TEST_F(FileSessionTest, GetLinePastEndIsEmpty) {
    auto path = dir_.write("short.txt", "only\n");

    FileSession session(path);
    ASSERT_TRUE(session.load());
    EXPECT_FALSE(session.getLine(1).has_value());
    EXPECT_FALSE(session.getLine(1000).has_value());
}

TEST_F(FileSessionTest, EmptyFileHasNoContent) {
    auto path = dir_.write("empty.txt", "");

    FileSession session(path);
    ASSERT_TRUE(session.load());
    EXPECT_EQ(session.getLineCount(), 0u);
    EXPECT_FALSE(session.getContent().has_value());
    EXPECT_EQ(session.preview(10), "");
}

TEST_F(FileSessionTest, MissingPathFailsWithPathInMessage) {
    auto path = dir_.path() / "nowhere.txt";

    FileSession session(path);
    auto result = session.load();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(result.error().message.rfind("Failed to load ", 0), 0u);
    EXPECT_NE(result.error().message.find("nowhere.txt"), std::string::npos);

    auto status = session.status();
    EXPECT_EQ(status.state, LoadState::Failed);
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->code, ErrorCode::FileNotFound);
    EXPECT_FALSE(session.getContent().has_value());
    EXPECT_FALSE(session.encoding().has_value());

    // A failed session stays failed
    EXPECT_FALSE(session.load());
}

TEST_F(FileSessionTest, DirectoryShowsSortedEntries) {
    dir_.write("listing/b.txt", "b");
    dir_.write("listing/a.txt", "a");

    FileSession session(dir_.path() / "listing");
    ASSERT_TRUE(session.load());

    EXPECT_EQ(session.status().state, LoadState::SyncLoaded);
    EXPECT_EQ(allLines(session), (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(session.getContent(), "a.txt\nb.txt");

    auto info = session.fileInfo();
    EXPECT_EQ(info.type, PathType::Directory);
    EXPECT_EQ(info.name, "listing");
    EXPECT_EQ(info.mimeType, "inode/directory");
    EXPECT_EQ(info.encoding, "UTF-8");
}

TEST_F(FileSessionTest, LargeFileLoadsInBackground) {
    const auto text = manyLines(5000);
    auto path = dir_.write("large.log", text);
    ASSERT_GT(text.size(), 2 * peek::DEFAULT_CHUNK_SIZE);

    FileSession session(path);
    ASSERT_TRUE(session.load());

    const auto early = session.status().state;
    EXPECT_TRUE(early == LoadState::BackgroundRunning || early == LoadState::BackgroundDone);

    session.wait();
    auto status = session.status();
    EXPECT_EQ(status.state, LoadState::BackgroundDone);
    EXPECT_EQ(status.progress.bytesRead, text.size());

    // Same lines a one-pass split would give
    EXPECT_EQ(allLines(session), peek::extraction::splitLines(text));
    EXPECT_EQ(session.getLine(4999), "entry 4999");
    EXPECT_EQ(session.encoding(), "UTF-8");

    auto content = session.getContent();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content + "\n", text);
}

TEST_F(FileSessionTest, SyncThresholdIsConfigurable) {
    peek::config::ViewerConfig config;
    config.chunkSize = 16;
    config.syncThreshold = 32;
    auto path = dir_.write("medium.txt", manyLines(10));

    FileSession session(path, config);
    ASSERT_TRUE(session.load());
    EXPECT_TRUE(session.waitFor(std::chrono::seconds(10)));
    EXPECT_EQ(session.status().state, LoadState::BackgroundDone);
    EXPECT_EQ(session.status().progress.chunksRead, (manyLines(10).size() + 15) / 16);
    EXPECT_EQ(session.getLineCount(), 10u);
}

TEST_F(FileSessionTest, BackgroundFailureShowsInStatus) {
    peek::config::ViewerConfig config;
    config.syncThreshold = 16;
    // No read buffer of this size can be allocated, so the background task fails
    config.chunkSize = std::numeric_limits<size_t>::max();
    auto path = dir_.write("doomed.txt", manyLines(20));

    FileSession session(path, config);
    ASSERT_TRUE(session.load());
    ASSERT_TRUE(session.waitFor(std::chrono::seconds(10)));

    auto status = session.status();
    EXPECT_EQ(status.state, LoadState::Failed);
    EXPECT_TRUE(status.isFinal());
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->code, ErrorCode::BackgroundLoadError);
    EXPECT_NE(status.error->message.find("doomed.txt"), std::string::npos);
    EXPECT_EQ(session.getLineCount(), 0u);
}

TEST_F(FileSessionTest, ProcFilesAreReadUntilEof) {
    // procfs reports size 0 for files that do have content
    const std::filesystem::path status("/proc/self/status");
    if (!std::filesystem::exists(status)) {
        GTEST_SKIP() << "no procfs";
    }

    FileSession session(status);
    ASSERT_TRUE(session.load());
    EXPECT_EQ(session.status().state, LoadState::SyncLoaded);
    EXPECT_GT(session.getLineCount(), 0u);
    EXPECT_EQ(session.getLine(0)->rfind("Name:", 0), 0u);
}

TEST_F(FileSessionTest, PreviewMarksMoreContent) {
    auto path = dir_.write("five.txt", "l0\nl1\nl2\nl3\nl4\n");

    FileSession session(path);
    ASSERT_TRUE(session.load());
    EXPECT_EQ(session.preview(2), "l0\nl1\n... (more content)");
    EXPECT_EQ(session.preview(5), "l0\nl1\nl2\nl3\nl4");
    EXPECT_EQ(session.preview(50), "l0\nl1\nl2\nl3\nl4");
}

TEST_F(FileSessionTest, BinaryFileShowsHexRows) {
    std::string data("\x7f" "ELF\x02\x01\x01\0\0\0\0\0\0\0\0\0\x03\0>\0", 20);
    auto path = dir_.write("tool.bin", data);

    FileSession session(path);
    ASSERT_TRUE(session.load());

    EXPECT_EQ(allLines(session), peek::content::HexDump::rows(toBytes(data)));
    auto info = session.fileInfo();
    EXPECT_TRUE(info.binary);
    EXPECT_EQ(info.sizeBytes, 20u);
    EXPECT_EQ(info.mimeType, "application/octet-stream");
}

TEST_F(FileSessionTest, UndecodableSmallFileFallsBackToHex) {
    // Latin-1 guesses fall under the default threshold, so UTF-8 is tried and fails
    const std::string data = "Caf\xE9\n";
    auto path = dir_.write("latin.txt", data);

    FileSession session(path);
    ASSERT_TRUE(session.load());

    EXPECT_EQ(session.status().state, LoadState::SyncLoaded);
    EXPECT_EQ(session.getLineCount(), 0u);
    EXPECT_EQ(session.getContent(), peek::content::HexDump::format(toBytes(data)));
    EXPECT_EQ(session.preview(10), session.getContent());
}

TEST_F(FileSessionTest, LowerThresholdAcceptsLatin1) {
    peek::config::ViewerConfig config;
    config.confidenceThreshold = 0.4;
    auto path = dir_.write("latin.txt", "Caf\xE9\n");

    FileSession session(path, config);
    ASSERT_TRUE(session.load());
    EXPECT_EQ(session.encoding(), "ISO-8859-1");
    EXPECT_EQ(session.getLine(0), "Caf\xC3\xA9");
}

TEST_F(FileSessionTest, SymlinkShowsTargetContent) {
    auto target = dir_.write("target.md", "# title\nbody\n");
    auto link = dir_.path() / "readme.md";
    std::filesystem::create_symlink(target, link);

    FileSession session(link);
    ASSERT_TRUE(session.load());

    auto info = session.fileInfo();
    EXPECT_EQ(info.type, PathType::Symlink);
    EXPECT_EQ(info.name, "readme.md");
    EXPECT_EQ(info.mimeType, "text/markdown");
    EXPECT_EQ(allLines(session), (std::vector<std::string>{"# title", "body"}));
}

TEST_F(FileSessionTest, SecondLoadIsNoOp) {
    auto path = dir_.write("twice.txt", "a\nb\n");

    FileSession session(path);
    ASSERT_TRUE(session.load());
    ASSERT_TRUE(session.load());
    EXPECT_EQ(session.getLineCount(), 2u);
}

TEST_F(FileSessionTest, FileInfoForTextFile) {
    auto path = dir_.write("data.json", "{\"k\": 1}\n");

    FileSession session(path);
    ASSERT_TRUE(session.load());

    auto info = session.fileInfo();
    EXPECT_EQ(info.name, "data.json");
    EXPECT_EQ(info.absolutePath, std::filesystem::absolute(path).lexically_normal());
    EXPECT_EQ(info.type, PathType::RegularFile);
    EXPECT_EQ(info.sizeBytes, 9u);
    EXPECT_EQ(info.mimeType, "application/json");
    EXPECT_FALSE(info.binary);
}

TEST_F(FileSessionTest, CancelLeavesPrefix) {
    auto path = dir_.write("huge.txt", manyLines(300000));

    FileSession session(path);
    ASSERT_TRUE(session.load());
    session.cancel();
    session.wait();

    const auto state = session.status().state;
    EXPECT_TRUE(state == LoadState::Cancelled || state == LoadState::BackgroundDone);
    for (size_t i = 0; i < std::min<size_t>(session.getLineCount(), 100); ++i) {
        EXPECT_EQ(session.getLine(i), "entry " + std::to_string(i));
    }
}

TEST(LoadStateTest, Names) {
    EXPECT_EQ(loadStateToString(LoadState::Unloaded), "unloaded");
    EXPECT_EQ(loadStateToString(LoadState::BackgroundDone), "background_done");
    EXPECT_EQ(loadStateToString(LoadState::Cancelled), "cancelled");
}

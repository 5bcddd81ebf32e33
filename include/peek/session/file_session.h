#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <peek/config/viewer_config.h>
#include <peek/content/line_cache.h>
#include <peek/core/types.h>
#include <peek/detection/path_classifier.h>
#include <peek/loader/chunked_loader.h>

namespace peek::session {

enum class LoadState { Unloaded, SyncLoaded, BackgroundRunning, BackgroundDone, Failed, Cancelled };

constexpr std::string_view loadStateToString(LoadState state) {
    switch (state) {
        case LoadState::Unloaded: return "unloaded";
        case LoadState::SyncLoaded: return "sync_loaded";
        case LoadState::BackgroundRunning: return "background_running";
        case LoadState::BackgroundDone: return "background_done";
        case LoadState::Failed: return "failed";
        case LoadState::Cancelled: return "cancelled";
    }
    return "unloaded";
}

/**
 * @brief Pollable session status; the UI checks it each refresh
 */
struct LoadStatus {
    LoadState state = LoadState::Unloaded;
    std::optional<Error> error; // Set when state is Failed
    loader::LoaderProgress progress;

    [[nodiscard]] bool isFinal() const noexcept {
        return state != LoadState::Unloaded && state != LoadState::BackgroundRunning;
    }
};

/**
 * @brief Read-only snapshot of what the session is showing
 */
struct FileInfo {
    std::string name;
    std::filesystem::path absolutePath;
    detection::PathType type = detection::PathType::Missing;
    uint64_t sizeBytes = 0;
    std::optional<std::string> encoding; // Unset until known (background loads decide late)
    std::string mimeType;
    bool binary = false; // Lines are hex dump rows
};

/**
 * @brief Immutable identity of one load session
 */
struct FileHandle {
    std::filesystem::path absolutePath;
    detection::PathType type = detection::PathType::Missing;
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
};

/**
 * @brief One path, from load() until the viewer moves on
 *
 * Small files (size <= syncThreshold) and directories are decoded inside load(). Larger files
 * are handed to a ChunkedLoader and load() returns at once; getLine()/getLineCount() then see
 * a growing prefix of the file until status() reports BackgroundDone.
 *
 * The session is driven from one thread. The background task shares only the line cache,
 * which is safe to read at any time. Destroying the session cancels and joins its task.
 */
class FileSession {
public:
    explicit FileSession(const std::filesystem::path& path, config::ViewerConfig config = {});
    ~FileSession();

    FileSession(const FileSession&) = delete;
    FileSession& operator=(const FileSession&) = delete;
    FileSession(FileSession&&) = delete;
    FileSession& operator=(FileSession&&) = delete;

    /**
     * @brief Classify and load the path
     *
     * Failures come back as a single error naming the path, with the buffer and encoding
     * cleared and the state set to Failed. Calling load() again after success is a no-op.
     */
    Result<void> load();

    [[nodiscard]] std::optional<std::string> getLine(size_t index) const {
        return cache_.getLine(index);
    }

    [[nodiscard]] size_t getLineCount() const noexcept { return cache_.getLineCount(); }

    /**
     * @brief Whole content: cached lines, else a direct decode, else a hex dump
     */
    [[nodiscard]] std::optional<std::string> getContent() const;

    [[nodiscard]] FileInfo fileInfo() const;

    [[nodiscard]] LoadStatus status() const;

    /**
     * @brief First maxLines lines, plus a "... (more content)" line when more exist or may
     * still arrive
     */
    [[nodiscard]] std::string preview(size_t maxLines) const;
    [[nodiscard]] std::string preview() const { return preview(config_.previewLines); }

    void cancel();
    void wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const FileHandle& handle() const noexcept { return handle_; }
    [[nodiscard]] std::optional<std::string> encoding() const;

private:
    Result<void> loadDirectory();
    Result<void> loadFile();
    void populateFromBuffer();

    FileHandle handle_;
    config::ViewerConfig config_;

    LoadState state_ = LoadState::Unloaded;
    std::optional<Error> error_;
    std::optional<ByteVector> raw_;
    std::optional<std::string> encoding_;
    bool binary_ = false;

    content::LineCache cache_;
    // Declared after the cache: destroyed (and joined) before it
    std::unique_ptr<loader::ChunkedLoader> loader_;
};

} // namespace peek::session

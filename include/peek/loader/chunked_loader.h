#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <peek/content/line_cache.h>
#include <peek/core/types.h>
#include <peek/extraction/line_splitter.h>

namespace peek::loader {

enum class LoaderState { Idle, Running, Done, Failed, Cancelled };

constexpr std::string_view loaderStateToString(LoaderState state) {
    switch (state) {
        case LoaderState::Idle: return "idle";
        case LoaderState::Running: return "running";
        case LoaderState::Done: return "done";
        case LoaderState::Failed: return "failed";
        case LoaderState::Cancelled: return "cancelled";
    }
    return "idle";
}

/**
 * @brief Configuration for background chunked decoding
 */
struct ChunkedLoaderConfig {
    size_t chunkSize = DEFAULT_CHUNK_SIZE;          // Bytes per read
    double confidenceThreshold = DEFAULT_CONFIDENCE_THRESHOLD;
    std::string defaultEncoding = DEFAULT_ENCODING; // Used when detection is not confident
    bool carryPartialSequences = true;              // Hold split characters for the next chunk
    size_t bytesPerLine = DEFAULT_BYTES_PER_LINE;   // Hex row width for binary content
};

/**
 * @brief Progress counters, readable while the loader runs
 */
struct LoaderProgress {
    uint64_t bytesRead = 0;
    size_t chunksRead = 0;
    size_t chunksSkipped = 0; // Chunks dropped because they did not decode
    size_t linesPublished = 0;
};

/**
 * @brief Decodes one file on a background thread, publishing finished lines to a LineCache
 *
 * The file is read in chunkSize pieces. The encoding is chosen from the first chunk and kept
 * for the whole file. A chunk that does not decode under it is skipped entirely (logged and
 * counted in LoaderProgress::chunksSkipped); lines are stitched across chunk boundaries, so a
 * skipped chunk's neighbours join up. When the first chunk looks binary the loader publishes
 * hex dump rows instead of text.
 *
 * State moves Idle -> Running -> {Done, Failed, Cancelled} and never back. Nothing is written
 * to the cache after leaving Running. The stop token is checked between chunks; destruction
 * requests stop and joins, so the cache must outlive the loader.
 */
class ChunkedLoader {
public:
    ChunkedLoader(std::filesystem::path path, content::LineCache& cache,
                  ChunkedLoaderConfig config = {});
    ~ChunkedLoader();

    ChunkedLoader(const ChunkedLoader&) = delete;
    ChunkedLoader& operator=(const ChunkedLoader&) = delete;
    ChunkedLoader(ChunkedLoader&&) = delete;
    ChunkedLoader& operator=(ChunkedLoader&&) = delete;

    /**
     * @brief Start the background task
     * @return false (and does nothing) if the loader was already started
     */
    bool start();

    /**
     * @brief Ask the task to stop before its next chunk; does not wait
     */
    void cancel();

    /**
     * @brief Block until the loader is no longer Running
     */
    void wait() const;

    /**
     * @brief Like wait() with a deadline; true if the loader finished in time
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] LoaderState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /**
     * @brief Failure reason once state() is Failed
     */
    [[nodiscard]] std::optional<Error> error() const;

    [[nodiscard]] LoaderProgress progress() const noexcept;

    /**
     * @brief Session encoding, unset until the first chunk has been examined
     */
    [[nodiscard]] std::optional<std::string> encoding() const;

    [[nodiscard]] bool binary() const noexcept { return binary_.load(std::memory_order_acquire); }

    [[nodiscard]] const ChunkedLoaderConfig& config() const noexcept { return config_; }

private:
    void run(std::stop_token stop);
    void chooseEncoding(ByteSpan firstChunk);
    void processTextChunk(ByteSpan chunk, uint64_t offset);
    void processHexChunk(ByteSpan chunk);
    void flush();
    void publish(std::vector<std::string>&& lines);
    void finish(LoaderState state, std::optional<Error> error = std::nullopt);

    std::filesystem::path path_;
    content::LineCache& cache_;
    ChunkedLoaderConfig config_;

    // Writer-only state, touched by the background thread alone
    std::string sessionEncoding_;
    ByteVector carry_;
    uint64_t rowOffset_ = 0;
    extraction::LineStitcher stitcher_;

    std::atomic<LoaderState> state_{LoaderState::Idle};
    std::atomic<bool> binary_{false};
    std::atomic<uint64_t> bytesRead_{0};
    std::atomic<size_t> chunksRead_{0};
    std::atomic<size_t> chunksSkipped_{0};
    std::atomic<size_t> linesPublished_{0};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<Error> error_;
    std::optional<std::string> encoding_;

    // Declared last so it is joined before anything it uses is destroyed
    std::jthread thread_;
};

} // namespace peek::loader

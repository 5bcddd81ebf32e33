#include <spdlog/spdlog.h>
#include <peek/content/hex_dump.h>
#include <peek/extraction/encoding_detector.h>
#include <peek/loader/chunked_loader.h>

#include <fstream>
#include <vector>

namespace peek::loader {

using extraction::EncodingDetector;

ChunkedLoader::ChunkedLoader(std::filesystem::path path, content::LineCache& cache,
                             ChunkedLoaderConfig config)
    : path_(std::move(path)), cache_(cache), config_(std::move(config)) {
    if (config_.chunkSize == 0) {
        config_.chunkSize = DEFAULT_CHUNK_SIZE;
    }
    if (config_.bytesPerLine == 0) {
        config_.bytesPerLine = DEFAULT_BYTES_PER_LINE;
    }
}

ChunkedLoader::~ChunkedLoader() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

bool ChunkedLoader::start() {
    // Idempotent check
    LoaderState expected = LoaderState::Idle;
    if (!state_.compare_exchange_strong(expected, LoaderState::Running,
                                        std::memory_order_acq_rel)) {
        spdlog::debug("[ChunkedLoader] {} already {}, skipping start", path_.string(),
                      loaderStateToString(expected));
        return false;
    }

    spdlog::debug("[ChunkedLoader] Starting background load of {} ({} byte chunks)",
                  path_.string(), config_.chunkSize);
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    return true;
}

void ChunkedLoader::cancel() {
    if (thread_.joinable()) {
        thread_.request_stop();
    }
}

void ChunkedLoader::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return state() != LoaderState::Running; });
}

bool ChunkedLoader::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return state() != LoaderState::Running; });
}

std::optional<Error> ChunkedLoader::error() const {
    std::lock_guard lock(mutex_);
    return error_;
}

LoaderProgress ChunkedLoader::progress() const noexcept {
    LoaderProgress p;
    p.bytesRead = bytesRead_.load(std::memory_order_relaxed);
    p.chunksRead = chunksRead_.load(std::memory_order_relaxed);
    p.chunksSkipped = chunksSkipped_.load(std::memory_order_relaxed);
    p.linesPublished = linesPublished_.load(std::memory_order_relaxed);
    return p;
}

std::optional<std::string> ChunkedLoader::encoding() const {
    std::lock_guard lock(mutex_);
    return encoding_;
}

void ChunkedLoader::run(std::stop_token stop) {
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            finish(LoaderState::Failed,
                   Error{ErrorCode::BackgroundLoadError, "Cannot open file: " + path_.string()});
            return;
        }

        std::vector<std::byte> buffer(config_.chunkSize);
        uint64_t offset = 0;
        bool first = true;

        while (!stop.stop_requested()) {
            file.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
            const auto got = file.gcount();
            if (file.bad() || (got == 0 && !file.eof())) {
                finish(LoaderState::Failed,
                       Error{ErrorCode::BackgroundLoadError,
                             "Read error in " + path_.string() + " at offset " +
                                 std::to_string(offset)});
                return;
            }
            if (got <= 0) {
                break;
            }

            auto chunk = ByteSpan(buffer).first(static_cast<size_t>(got));
            bytesRead_.fetch_add(chunk.size(), std::memory_order_relaxed);
            chunksRead_.fetch_add(1, std::memory_order_relaxed);

            if (first) {
                chooseEncoding(chunk);
                first = false;
            }

            if (binary_.load(std::memory_order_relaxed)) {
                processHexChunk(chunk);
            } else {
                processTextChunk(chunk, offset);
            }
            offset += chunk.size();
        }

        // Only a stop that cut the read loop short counts; at EOF every byte was processed
        if (!file.eof()) {
            spdlog::debug("[ChunkedLoader] Cancelled {} after {} bytes", path_.string(), offset);
            finish(LoaderState::Cancelled);
            return;
        }

        if (first) {
            // Nothing to sniff; the file shrank to nothing after it was sized
            chooseEncoding({});
        }
        flush();
        spdlog::debug("[ChunkedLoader] Finished {}: {} lines, {} chunk(s) skipped",
                      path_.string(), cache_.getLineCount(),
                      chunksSkipped_.load(std::memory_order_relaxed));
        finish(LoaderState::Done);
    } catch (const std::exception& e) {
        finish(LoaderState::Failed,
               Error{ErrorCode::BackgroundLoadError,
                     "Background load of " + path_.string() + " failed: " + e.what()});
    }
}

void ChunkedLoader::chooseEncoding(ByteSpan firstChunk) {
    auto guess = EncodingDetector::detect(firstChunk);
    sessionEncoding_ = EncodingDetector::chooseEncoding(guess, config_.confidenceThreshold,
                                                        config_.defaultEncoding);
    binary_.store(guess.binary, std::memory_order_release);

    spdlog::debug("[ChunkedLoader] {}: detected '{}' ({:.2f}), using {}{}", path_.string(),
                  guess.encoding, guess.confidence, sessionEncoding_,
                  guess.binary ? " (binary, hex view)" : "");

    std::lock_guard lock(mutex_);
    encoding_ = sessionEncoding_;
}

void ChunkedLoader::processTextChunk(ByteSpan chunk, uint64_t offset) {
    ByteVector joined;
    ByteSpan data = chunk;
    const bool atFileStart = offset == carry_.size();
    if (!carry_.empty()) {
        joined.reserve(carry_.size() + chunk.size());
        joined.insert(joined.end(), carry_.begin(), carry_.end());
        joined.insert(joined.end(), chunk.begin(), chunk.end());
        data = joined;
        carry_.clear();
    }

    const size_t hold = config_.carryPartialSequences
                            ? EncodingDetector::incompleteTailLength(data, sessionEncoding_)
                            : 0;
    auto body = data.first(data.size() - hold);
    carry_.assign(data.end() - static_cast<std::ptrdiff_t>(hold), data.end());

    auto decoded = EncodingDetector::decode(body, sessionEncoding_, atFileStart);
    if (!decoded) {
        chunksSkipped_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[ChunkedLoader] Skipping chunk at offset {} of {}: not decodable as {} ({})",
                     offset, path_.string(), sessionEncoding_, decoded.error().message);
        return;
    }

    publish(stitcher_.feed(decoded.value()));
}

void ChunkedLoader::processHexChunk(ByteSpan chunk) {
    ByteVector joined;
    ByteSpan data = chunk;
    if (!carry_.empty()) {
        joined.reserve(carry_.size() + chunk.size());
        joined.insert(joined.end(), carry_.begin(), carry_.end());
        joined.insert(joined.end(), chunk.begin(), chunk.end());
        data = joined;
    }

    const size_t full = data.size() - data.size() % config_.bytesPerLine;
    publish(content::HexDump::rows(data.first(full), rowOffset_, config_.bytesPerLine));
    rowOffset_ += full;
    carry_.assign(data.begin() + static_cast<std::ptrdiff_t>(full), data.end());
}

void ChunkedLoader::flush() {
    if (binary_.load(std::memory_order_relaxed)) {
        if (!carry_.empty()) {
            std::vector<std::string> rows;
            rows.push_back(content::HexDump::formatRow(carry_, rowOffset_, config_.bytesPerLine));
            publish(std::move(rows));
            carry_.clear();
        }
        return;
    }

    if (!carry_.empty()) {
        // Sequence cut off by end of file
        const bool atFileStart = bytesRead_.load(std::memory_order_relaxed) == carry_.size();
        auto decoded = EncodingDetector::decode(carry_, sessionEncoding_, atFileStart);
        if (decoded) {
            publish(stitcher_.feed(decoded.value()));
        } else {
            chunksSkipped_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[ChunkedLoader] Dropping {} trailing byte(s) of {}: {}", carry_.size(),
                         path_.string(), decoded.error().message);
        }
        carry_.clear();
    }
    publish(stitcher_.finish());
}

void ChunkedLoader::publish(std::vector<std::string>&& lines) {
    const size_t n = lines.size();
    if (n == 0) {
        return;
    }
    cache_.appendBatch(std::move(lines));
    linesPublished_.fetch_add(n, std::memory_order_relaxed);
}

void ChunkedLoader::finish(LoaderState state, std::optional<Error> error) {
    if (error) {
        spdlog::error("[ChunkedLoader] {}", error->message);
    }
    {
        std::lock_guard lock(mutex_);
        error_ = std::move(error);
        state_.store(state, std::memory_order_release);
    }
    cv_.notify_all();
}

} // namespace peek::loader

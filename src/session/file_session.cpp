#include <spdlog/spdlog.h>
#include <peek/content/content_assembler.h>
#include <peek/content/directory_adapter.h>
#include <peek/content/hex_dump.h>
#include <peek/detection/file_type_detector.h>
#include <peek/extraction/encoding_detector.h>
#include <peek/extraction/line_splitter.h>
#include <peek/session/file_session.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace peek::session {

namespace fs = std::filesystem;
using extraction::EncodingDetector;

namespace {

fs::path makeAbsolute(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    auto normal = ec ? path : absolute.lexically_normal();
    // "dir/" normalizes with an empty filename
    if (!normal.has_filename() && normal.has_parent_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

constexpr size_t kReadBlock = 64 * 1024;

// Reads until EOF; fifos and procfs files have no usable size up front
Result<ByteVector> readWholeFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IOError, "Cannot open file"};
    }

    ByteVector buffer;
    while (file) {
        const size_t used = buffer.size();
        buffer.resize(used + kReadBlock);
        file.read(reinterpret_cast<char*>(buffer.data() + used),
                  static_cast<std::streamsize>(kReadBlock));
        buffer.resize(used + static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        return Error{ErrorCode::IOError, "Read error"};
    }
    return buffer;
}

} // namespace

FileSession::FileSession(const fs::path& path, config::ViewerConfig config)
    : config_(std::move(config)) {
    handle_.absolutePath = makeAbsolute(path);
    handle_.type = detection::PathClassifier::classify(handle_.absolutePath);
    handle_.chunkSize = config_.chunkSize > 0 ? config_.chunkSize : DEFAULT_CHUNK_SIZE;
}

FileSession::~FileSession() {
    if (loader_) {
        loader_->cancel();
    }
}

Result<void> FileSession::load() {
    if (state_ == LoadState::Failed && error_) {
        return *error_;
    }
    if (state_ != LoadState::Unloaded) {
        spdlog::debug("[FileSession] {} already {}", handle_.absolutePath.string(),
                      loadStateToString(state_));
        return Result<void>();
    }

    spdlog::debug("[FileSession] Loading {} as {}", handle_.absolutePath.string(),
                  detection::pathTypeToString(handle_.type));

    Result<void> result;
    switch (handle_.type) {
        case detection::PathType::Missing:
            result = Error{ErrorCode::FileNotFound, "no such file or directory"};
            break;
        case detection::PathType::Directory:
            result = loadDirectory();
            break;
        case detection::PathType::Symlink:
        case detection::PathType::RegularFile:
            result = loadFile();
            break;
    }

    if (!result) {
        raw_.reset();
        encoding_.reset();
        binary_ = false;
        state_ = LoadState::Failed;
        error_ = Error{result.error().code, "Failed to load " + handle_.absolutePath.string() +
                                                ": " + result.error().message};
        spdlog::error("[FileSession] {}", error_->message);
        return *error_;
    }
    return result;
}

Result<void> FileSession::loadDirectory() {
    auto listing = content::DirectoryAdapter::buildContent(handle_.absolutePath);
    if (!listing) {
        return listing.error();
    }

    raw_ = std::move(listing).value();
    encoding_ = std::string(DEFAULT_ENCODING);
    populateFromBuffer();
    state_ = LoadState::SyncLoaded;
    return Result<void>();
}

Result<void> FileSession::loadFile() {
    std::error_code ec;
    const auto size = fs::file_size(handle_.absolutePath, ec);
    if (ec) {
        // Character devices and fifos have no size; read them until EOF
        spdlog::debug("[FileSession] No size for {}: {}", handle_.absolutePath.string(),
                      ec.message());
    } else if (size > config_.syncThreshold) {
        auto loaderConfig = config_.loaderConfig();
        loaderConfig.chunkSize = handle_.chunkSize;
        loader_ =
            std::make_unique<loader::ChunkedLoader>(handle_.absolutePath, cache_, loaderConfig);
        loader_->start();
        state_ = LoadState::BackgroundRunning;
        return Result<void>();
    }

    auto bytes = readWholeFile(handle_.absolutePath);
    if (!bytes) {
        return bytes.error();
    }

    auto guess = EncodingDetector::detect(bytes.value());
    encoding_ = EncodingDetector::chooseEncoding(guess, config_.confidenceThreshold,
                                                 config_.defaultEncoding);
    binary_ = guess.binary;
    raw_ = std::move(bytes).value();

    spdlog::debug("[FileSession] {}: {} bytes, detected '{}' ({:.2f}), using {}",
                  handle_.absolutePath.string(), raw_->size(), guess.encoding, guess.confidence,
                  *encoding_);

    populateFromBuffer();
    state_ = LoadState::SyncLoaded;
    return Result<void>();
}

void FileSession::populateFromBuffer() {
    if (!raw_ || raw_->empty()) {
        return;
    }

    if (binary_) {
        cache_.appendBatch(content::HexDump::rows(*raw_, 0, config_.bytesPerLine));
        return;
    }

    auto decoded = EncodingDetector::decode(*raw_, *encoding_);
    if (!decoded) {
        // getContent() falls back to a hex dump of the buffer
        spdlog::warn("[FileSession] {} is not valid {}: {}", handle_.absolutePath.string(),
                     *encoding_, decoded.error().message);
        return;
    }
    cache_.appendBatch(extraction::splitLines(decoded.value()));
}

std::optional<std::string> FileSession::getContent() const {
    if (state_ == LoadState::Unloaded || state_ == LoadState::Failed) {
        return std::nullopt;
    }
    content::ContentAssembler assembler(config_.bytesPerLine);
    return assembler.assemble(cache_, raw_, encoding());
}

std::optional<std::string> FileSession::encoding() const {
    if (encoding_) {
        return encoding_;
    }
    if (loader_) {
        return loader_->encoding();
    }
    return std::nullopt;
}

FileInfo FileSession::fileInfo() const {
    FileInfo info;
    info.absolutePath = handle_.absolutePath;
    info.name = handle_.absolutePath.filename().string();
    info.type = handle_.type;
    info.encoding = encoding();
    info.binary = loader_ ? loader_->binary() : binary_;

    const bool isDirectory = handle_.type == detection::PathType::Directory;
    info.mimeType = detection::FileTypeDetector::getMimeTypeForPath(handle_.absolutePath,
                                                                    isDirectory);
    if (isDirectory) {
        info.sizeBytes = raw_ ? raw_->size() : 0;
    } else if (handle_.type != detection::PathType::Missing) {
        std::error_code ec;
        const auto size = fs::file_size(handle_.absolutePath, ec);
        info.sizeBytes = ec ? (raw_ ? raw_->size() : 0) : size;
    }
    return info;
}

LoadStatus FileSession::status() const {
    LoadStatus status;
    status.state = state_;
    status.error = error_;

    if (loader_) {
        status.progress = loader_->progress();
        switch (loader_->state()) {
            case loader::LoaderState::Idle:
            case loader::LoaderState::Running:
                status.state = LoadState::BackgroundRunning;
                break;
            case loader::LoaderState::Done:
                status.state = LoadState::BackgroundDone;
                break;
            case loader::LoaderState::Failed:
                status.state = LoadState::Failed;
                status.error = loader_->error();
                break;
            case loader::LoaderState::Cancelled:
                status.state = LoadState::Cancelled;
                break;
        }
    } else if (raw_) {
        status.progress.bytesRead = raw_->size();
        status.progress.chunksRead = raw_->empty() ? 0 : 1;
        status.progress.linesPublished = cache_.getLineCount();
    }
    return status;
}

std::string FileSession::preview(size_t maxLines) const {
    std::vector<std::string> lines;
    bool more = false;

    if (!cache_.empty()) {
        lines = cache_.snapshot(maxLines);
        more = cache_.getLineCount() > maxLines;
    } else if (auto content = getContent()) {
        auto all = extraction::splitLines(*content);
        more = all.size() > maxLines;
        if (more) {
            all.resize(maxLines);
        }
        lines = std::move(all);
    }

    if (status().state == LoadState::BackgroundRunning) {
        more = true;
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    if (more) {
        if (!out.empty()) {
            out += '\n';
        }
        out += "... (more content)";
    }
    return out;
}

void FileSession::cancel() {
    if (loader_) {
        loader_->cancel();
    }
}

void FileSession::wait() const {
    if (loader_) {
        loader_->wait();
    }
}

bool FileSession::waitFor(std::chrono::milliseconds timeout) const {
    return loader_ ? loader_->waitFor(timeout) : true;
}

} // namespace peek::session

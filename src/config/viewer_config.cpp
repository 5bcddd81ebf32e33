#include <spdlog/spdlog.h>
#include <peek/config/config_helpers.h>
#include <peek/config/viewer_config.h>
#include <peek/extraction/encoding_detector.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace peek::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info",    "warn",
                                                        "error", "critical", "off"};

Result<size_t> parseSize(const std::string& key, const std::string& raw) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "viewer." + key + ": expected a non-negative integer, got '" + raw + "'"};
    }
    return value;
}

Result<double> parseDouble(const std::string& key, const std::string& raw) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "viewer." + key + ": expected a number, got '" + raw + "'"};
    }
    return value;
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument,
                 "viewer." + key + ": expected true or false, got '" + raw + "'"};
}

} // namespace

loader::ChunkedLoaderConfig ViewerConfig::loaderConfig() const {
    loader::ChunkedLoaderConfig cfg;
    cfg.chunkSize = chunkSize;
    cfg.confidenceThreshold = confidenceThreshold;
    cfg.defaultEncoding = defaultEncoding;
    cfg.carryPartialSequences = carryPartialSequences;
    cfg.bytesPerLine = bytesPerLine;
    return cfg;
}

Result<void> validateViewerConfig(const ViewerConfig& config) {
    if (config.chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "viewer.chunk_size must be greater than 0"};
    }
    if (config.bytesPerLine == 0) {
        return Error{ErrorCode::InvalidArgument, "viewer.bytes_per_line must be greater than 0"};
    }
    if (config.confidenceThreshold < 0.0 || config.confidenceThreshold > 1.0) {
        return Error{ErrorCode::InvalidArgument,
                     "viewer.confidence_threshold must be between 0 and 1"};
    }
    if (!extraction::EncodingDetector::canonicalName(config.defaultEncoding)) {
        return Error{ErrorCode::InvalidArgument,
                     "viewer.default_encoding is not supported: " + config.defaultEncoding};
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.logLevel) == kLogLevels.end()) {
        return Error{ErrorCode::InvalidArgument,
                     "viewer.log_level is not a level: " + config.logLevel};
    }
    return Result<void>{};
}

Result<ViewerConfig> loadViewerConfig(const std::filesystem::path& configPath) {
    ViewerConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        spdlog::debug("[ViewerConfig] No viewer config at {}, using defaults", configPath.string());
        return config;
    }

    const auto values = parse_config_section(configPath, "viewer");
    bool thresholdSet = false;

    for (const auto& [key, raw] : values) {
        if (key == "chunk_size") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            config.chunkSize = v.value();
        } else if (key == "sync_threshold") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            config.syncThreshold = v.value();
            thresholdSet = true;
        } else if (key == "bytes_per_line") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            config.bytesPerLine = v.value();
        } else if (key == "confidence_threshold") {
            auto v = parseDouble(key, raw);
            if (!v)
                return v.error();
            config.confidenceThreshold = v.value();
        } else if (key == "default_encoding") {
            config.defaultEncoding = raw;
        } else if (key == "carry_partial_sequences") {
            auto v = parseBool(key, raw);
            if (!v)
                return v.error();
            config.carryPartialSequences = v.value();
        } else if (key == "preview_lines") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            config.previewLines = v.value();
        } else if (key == "log_level") {
            config.logLevel = raw;
        } else {
            spdlog::warn("[ViewerConfig] Ignoring unknown key viewer.{} in {}", key,
                         configPath.string());
        }
    }

    if (!thresholdSet) {
        config.syncThreshold = 2 * config.chunkSize;
    }

    if (auto valid = validateViewerConfig(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<ViewerConfig> loadViewerConfig() {
    return loadViewerConfig(get_config_path());
}

void applyLogLevel(const ViewerConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.logLevel));
}

} // namespace peek::config

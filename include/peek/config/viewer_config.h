#pragma once

#include <filesystem>
#include <string>
#include <peek/core/types.h>
#include <peek/loader/chunked_loader.h>

namespace peek::config {

/**
 * @brief Tunables for a viewing session, read from the [viewer] section of config.toml
 *
 * Keys: chunk_size, sync_threshold, bytes_per_line, confidence_threshold, default_encoding,
 * carry_partial_sequences, preview_lines, log_level. When sync_threshold is absent it follows
 * chunk_size (twice its value).
 */
struct ViewerConfig {
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    size_t syncThreshold = 2 * DEFAULT_CHUNK_SIZE; // Files up to this size load synchronously
    size_t bytesPerLine = DEFAULT_BYTES_PER_LINE;
    double confidenceThreshold = DEFAULT_CONFIDENCE_THRESHOLD;
    std::string defaultEncoding = DEFAULT_ENCODING;
    bool carryPartialSequences = true;
    size_t previewLines = 100;
    std::string logLevel = "warn";

    [[nodiscard]] loader::ChunkedLoaderConfig loaderConfig() const;
};

/**
 * @brief Check ranges and names; InvalidArgument describes the first problem found
 */
Result<void> validateViewerConfig(const ViewerConfig& config);

/**
 * @brief Load from a file; a missing file yields the defaults
 */
Result<ViewerConfig> loadViewerConfig(const std::filesystem::path& configPath);

/**
 * @brief Load from get_config_path()
 */
Result<ViewerConfig> loadViewerConfig();

/**
 * @brief Set the spdlog default logger level from config.logLevel
 */
void applyLogLevel(const ViewerConfig& config);

} // namespace peek::config

#pragma once

#include <filesystem>
#include <string>

namespace peek::detection {

/**
 * @brief Extension-based MIME lookup used for FileInfo
 *
 * Content sniffing is left to EncodingDetector; this only answers what the name suggests.
 */
class FileTypeDetector {
public:
    /**
     * @brief Get MIME type from file extension
     * @param extension Extension with or without the leading dot, any case
     * @return MIME type, or "application/octet-stream" when unknown
     */
    static std::string getMimeTypeFromExtension(const std::string& extension);

    /**
     * @brief Get MIME type for a path; directories report "inode/directory"
     */
    static std::string getMimeTypeForPath(const std::filesystem::path& path, bool isDirectory);
};

} // namespace peek::detection

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <peek/core/types.h>

namespace peek::content {

/**
 * @brief Presents a directory as text: one child name per line, sorted by name
 */
class DirectoryAdapter {
public:
    /**
     * @brief Names of the immediate children, sorted
     * @return DirectoryReadError if the directory cannot be enumerated
     */
    static Result<std::vector<std::string>> listEntries(const std::filesystem::path& dir);

    /**
     * @brief Entry names joined with '\n', as UTF-8 bytes
     */
    static Result<ByteVector> buildContent(const std::filesystem::path& dir);
};

} // namespace peek::content

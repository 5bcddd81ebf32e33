#pragma once

#include <filesystem>
#include <string_view>

namespace peek::detection {

/**
 * @brief Classified kind of a filesystem path
 */
enum class PathType { Missing, Directory, Symlink, RegularFile };

constexpr std::string_view pathTypeToString(PathType type) {
    switch (type) {
        case PathType::Missing: return "missing";
        case PathType::Directory: return "directory";
        case PathType::Symlink: return "symlink";
        case PathType::RegularFile: return "file";
    }
    return "missing";
}

/**
 * @brief Determines what a path refers to, once per session
 *
 * Existence and directory checks follow links, so a dangling link is Missing and a link to a
 * directory is a Directory. Any other link is a Symlink; everything else that exists is a
 * RegularFile (devices and fifos included).
 */
class PathClassifier {
public:
    [[nodiscard]] static PathType classify(const std::filesystem::path& path) noexcept;
};

} // namespace peek::detection

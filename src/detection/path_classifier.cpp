#include <peek/detection/path_classifier.h>

#include <system_error>

namespace peek::detection {

PathType PathClassifier::classify(const std::filesystem::path& path) noexcept {
    std::error_code ec;

    // fs::status() follows links; a dangling link reports not_found here
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return PathType::Missing;
    }
    if (std::filesystem::is_directory(status)) {
        return PathType::Directory;
    }

    const auto linkStatus = std::filesystem::symlink_status(path, ec);
    if (!ec && std::filesystem::is_symlink(linkStatus)) {
        return PathType::Symlink;
    }
    return PathType::RegularFile;
}

} // namespace peek::detection

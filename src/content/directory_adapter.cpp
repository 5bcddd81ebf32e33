#include <spdlog/spdlog.h>
#include <peek/content/directory_adapter.h>

#include <algorithm>
#include <cstring>
#include <system_error>

namespace peek::content {

Result<std::vector<std::string>> DirectoryAdapter::listEntries(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::DirectoryReadError,
                     "Cannot read directory " + dir.string() + ": " + ec.message()};
    }

    std::vector<std::string> names;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Error{ErrorCode::DirectoryReadError,
                     "Directory listing interrupted for " + dir.string() + ": " + ec.message()};
    }

    std::sort(names.begin(), names.end());
    spdlog::debug("[DirectoryAdapter] Listed {} entries in {}", names.size(), dir.string());
    return names;
}

Result<ByteVector> DirectoryAdapter::buildContent(const std::filesystem::path& dir) {
    auto names = listEntries(dir);
    if (!names) {
        return names.error();
    }

    std::string joined;
    for (const auto& name : names.value()) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined.append(name);
    }

    ByteVector bytes(joined.size());
    std::memcpy(bytes.data(), joined.data(), joined.size());
    return bytes;
}

} // namespace peek::content

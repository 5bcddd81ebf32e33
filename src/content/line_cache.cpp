#include <peek/content/line_cache.h>

#include <algorithm>
#include <mutex>

namespace peek::content {

void LineCache::append(std::string line) {
    std::unique_lock lock(mutex_);
    lines_.push_back(std::move(line));
    count_.store(lines_.size(), std::memory_order_release);
}

void LineCache::appendBatch(std::vector<std::string>&& lines) {
    if (lines.empty()) {
        return;
    }
    std::unique_lock lock(mutex_);
    for (auto& line : lines) {
        lines_.push_back(std::move(line));
    }
    count_.store(lines_.size(), std::memory_order_release);
    lines.clear();
}

std::optional<std::string> LineCache::getLine(size_t index) const {
    if (index >= getLineCount()) {
        return std::nullopt;
    }
    std::shared_lock lock(mutex_);
    return lines_[index];
}

std::vector<std::string> LineCache::snapshot(size_t count) const {
    const size_t visible = std::min(count, getLineCount());
    std::vector<std::string> out;
    out.reserve(visible);

    std::shared_lock lock(mutex_);
    for (size_t i = 0; i < visible; ++i) {
        out.push_back(lines_[i]);
    }
    return out;
}

std::string LineCache::join(std::string_view separator) const {
    const size_t visible = getLineCount();
    std::string out;

    std::shared_lock lock(mutex_);
    size_t total = visible > 0 ? (visible - 1) * separator.size() : 0;
    for (size_t i = 0; i < visible; ++i) {
        total += lines_[i].size();
    }
    out.reserve(total);
    for (size_t i = 0; i < visible; ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(lines_[i]);
    }
    return out;
}

} // namespace peek::content

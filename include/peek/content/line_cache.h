#pragma once

#include <atomic>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace peek::content {

/**
 * @brief Append-only line store shared by one writer and any number of readers
 *
 * Lines are stored under an exclusive lock and only then made visible by bumping an atomic
 * count (release), so a reader that sees index i in the count (acquire) also sees the whole
 * line. Entries are never removed or rewritten; the count never decreases.
 */
class LineCache {
public:
    LineCache() = default;
    LineCache(const LineCache&) = delete;
    LineCache& operator=(const LineCache&) = delete;

    void append(std::string line);

    /**
     * @brief Publish a batch of lines with a single lock acquisition
     */
    void appendBatch(std::vector<std::string>&& lines);

    /**
     * @brief Line at index, or nullopt if it has not been written (yet)
     */
    [[nodiscard]] std::optional<std::string> getLine(size_t index) const;

    /**
     * @brief Highest written index + 1; may lag behind an active writer
     */
    [[nodiscard]] size_t getLineCount() const noexcept {
        return count_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool empty() const noexcept { return getLineCount() == 0; }

    /**
     * @brief Copy of lines [0, min(count, getLineCount()))
     */
    [[nodiscard]] std::vector<std::string> snapshot(size_t count) const;

    /**
     * @brief All currently visible lines joined with the separator
     */
    [[nodiscard]] std::string join(std::string_view separator = "\n") const;

private:
    mutable std::shared_mutex mutex_;
    std::deque<std::string> lines_;
    std::atomic<size_t> count_{0};
};

} // namespace peek::content

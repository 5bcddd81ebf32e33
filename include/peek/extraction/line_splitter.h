#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace peek::extraction {

/**
 * @brief Split decoded text into lines
 *
 * Terminators are "\n", "\r\n" and a lone "\r". A terminator at the very end does not open an
 * extra empty line, so "a\nb\n" and "a\nb" both give {"a", "b"} and "" gives no lines.
 */
std::vector<std::string> splitLines(std::string_view text);

/**
 * @brief Joins lines that straddle chunk boundaries
 *
 * Owns the pending tail: the text after the last terminator of everything fed so far. A
 * trailing '\r' is kept pending too, since the next chunk may start with the matching '\n'.
 * Not thread-safe; it belongs to the single writer.
 */
class LineStitcher {
public:
    /**
     * @brief Feed the next piece of decoded text
     * @return Lines completed by this piece, in order
     */
    std::vector<std::string> feed(std::string_view text);

    /**
     * @brief End of input: flush the pending tail as the final line, if there is one
     */
    std::vector<std::string> finish();

    [[nodiscard]] bool hasPending() const noexcept { return !pending_.empty(); }

private:
    std::string pending_;
};

} // namespace peek::extraction

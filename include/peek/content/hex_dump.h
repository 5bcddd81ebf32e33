#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <peek/core/types.h>

namespace peek::content {

/**
 * @brief Hex/ASCII dump renderer for content that cannot be shown as text
 *
 * Row layout for bytesPerLine = 16:
 *   00000010  48 65 6c 6c 6f 00 ...                           |Hello.|
 * 8-digit lowercase offset, two spaces, the hex column right-padded to bytesPerLine * 3
 * characters, two spaces, then the printable bytes [0x20, 0x7e] between pipes with every other
 * byte shown as '.'.
 */
class HexDump {
public:
    /**
     * @brief Render one row; row.size() must not exceed bytesPerLine
     */
    [[nodiscard]] static std::string formatRow(ByteSpan row, uint64_t offset,
                                               size_t bytesPerLine = DEFAULT_BYTES_PER_LINE);

    /**
     * @brief Render data as rows, the first one labelled with baseOffset
     */
    [[nodiscard]] static std::vector<std::string>
    rows(ByteSpan data, uint64_t baseOffset = 0, size_t bytesPerLine = DEFAULT_BYTES_PER_LINE);

    /**
     * @brief Rows joined with '\n'; empty input gives an empty string
     */
    [[nodiscard]] static std::string format(ByteSpan data,
                                            size_t bytesPerLine = DEFAULT_BYTES_PER_LINE);

    [[nodiscard]] static constexpr bool isPrintable(std::byte b) noexcept {
        auto value = static_cast<unsigned char>(b);
        return value >= 0x20 && value <= 0x7e;
    }
};

} // namespace peek::content

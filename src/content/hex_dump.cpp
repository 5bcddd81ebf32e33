#include <peek/content/hex_dump.h>
#include <peek/core/format.h>

#include <algorithm>

namespace peek::content {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
}

std::string HexDump::formatRow(ByteSpan row, uint64_t offset, size_t bytesPerLine) {
    if (bytesPerLine == 0) {
        bytesPerLine = DEFAULT_BYTES_PER_LINE;
    }
    const size_t hexWidth = bytesPerLine * 3;

    std::string out = peek::format("{:08x}", offset);
    out.reserve(8 + 2 + hexWidth + 2 + row.size() + 2);
    out.append("  ");

    std::string hex;
    hex.reserve(hexWidth);
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            hex.push_back(' ');
        }
        const auto value = static_cast<unsigned char>(row[i]);
        hex.push_back(kHexDigits[value >> 4]);
        hex.push_back(kHexDigits[value & 0x0f]);
    }
    if (hex.size() < hexWidth) {
        hex.append(hexWidth - hex.size(), ' ');
    }
    out.append(hex);

    out.append("  |");
    for (auto b : row) {
        out.push_back(isPrintable(b) ? static_cast<char>(b) : '.');
    }
    out.push_back('|');
    return out;
}

std::vector<std::string> HexDump::rows(ByteSpan data, uint64_t baseOffset, size_t bytesPerLine) {
    if (bytesPerLine == 0) {
        bytesPerLine = DEFAULT_BYTES_PER_LINE;
    }
    std::vector<std::string> out;
    out.reserve((data.size() + bytesPerLine - 1) / bytesPerLine);
    for (size_t i = 0; i < data.size(); i += bytesPerLine) {
        auto row = data.subspan(i, std::min(bytesPerLine, data.size() - i));
        out.push_back(formatRow(row, baseOffset + i, bytesPerLine));
    }
    return out;
}

std::string HexDump::format(ByteSpan data, size_t bytesPerLine) {
    std::string out;
    for (const auto& row : rows(data, 0, bytesPerLine)) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out.append(row);
    }
    return out;
}

} // namespace peek::content

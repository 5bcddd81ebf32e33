#include <peek/extraction/encoding_detector.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <unordered_map>

namespace peek::extraction {

namespace {

inline uint8_t byteAt(ByteSpan data, size_t i) noexcept {
    return static_cast<uint8_t>(data[i]);
}

// Expected length of a UTF-8 sequence from its lead byte, 0 for bytes that cannot lead
size_t utf8SequenceLength(uint8_t lead) noexcept {
    if (lead <= 0x7F)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

// Length of the well-formed sequence starting at i, 0 when malformed or truncated
size_t validUtf8SequenceAt(ByteSpan data, size_t i) noexcept {
    const uint8_t lead = byteAt(data, i);
    const size_t len = utf8SequenceLength(lead);
    if (len == 0 || i + len > data.size())
        return 0;
    if (len == 1)
        return 1;

    // Second-byte ranges exclude overlongs, surrogates and code points above U+10FFFF
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead == 0xE0)
        lo = 0xA0;
    else if (lead == 0xED)
        hi = 0x9F;
    else if (lead == 0xF0)
        lo = 0x90;
    else if (lead == 0xF4)
        hi = 0x8F;

    const uint8_t second = byteAt(data, i + 1);
    if (second < lo || second > hi)
        return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((byteAt(data, i + k) & 0xC0) != 0x80)
            return 0;
    }
    return len;
}

// Offset of the first malformed byte, data.size() when everything is well-formed
size_t firstInvalidUtf8(ByteSpan data) noexcept {
    size_t i = 0;
    while (i < data.size()) {
        const size_t len = validUtf8SequenceAt(data, i);
        if (len == 0)
            return i;
        i += len;
    }
    return data.size();
}

size_t utf8IncompleteTail(ByteSpan data) noexcept {
    const size_t n = data.size();
    const size_t maxBack = std::min<size_t>(3, n);
    for (size_t back = 1; back <= maxBack; ++back) {
        const uint8_t b = byteAt(data, n - back);
        if ((b & 0xC0) == 0x80)
            continue;
        return utf8SequenceLength(b) > back ? back : 0;
    }
    return 0;
}

uint16_t utf16UnitAt(ByteSpan data, size_t i, bool le) noexcept {
    return le ? static_cast<uint16_t>(byteAt(data, i + 1) << 8 | byteAt(data, i))
              : static_cast<uint16_t>(byteAt(data, i) << 8 | byteAt(data, i + 1));
}

size_t utf16IncompleteTail(ByteSpan data, bool le) noexcept {
    size_t carry = data.size() % 2;
    const size_t even = data.size() - carry;
    if (even >= 2) {
        const uint16_t last = utf16UnitAt(data, even - 2, le);
        if (last >= 0xD800 && last <= 0xDBFF)
            carry += 2;
    }
    return carry;
}

inline void appendUtf8FromCodepoint(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

Result<std::string> decodeUtf8(ByteSpan data, bool stripBom) {
    if (stripBom && data.size() >= 3 && byteAt(data, 0) == 0xEF && byteAt(data, 1) == 0xBB &&
        byteAt(data, 2) == 0xBF) {
        data = data.subspan(3);
    }
    const size_t bad = firstInvalidUtf8(data);
    if (bad != data.size()) {
        return Error{ErrorCode::ChunkDecodeError,
                     "Invalid UTF-8 sequence at byte " + std::to_string(bad)};
    }
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

Result<std::string> decodeAscii(ByteSpan data) {
    for (size_t i = 0; i < data.size(); ++i) {
        if (byteAt(data, i) > 0x7F) {
            return Error{ErrorCode::ChunkDecodeError,
                         "Non-ASCII byte at offset " + std::to_string(i)};
        }
    }
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

std::string decodeLatin1(ByteSpan data) {
    std::string out;
    out.reserve(data.size());
    for (auto b : data) {
        appendUtf8FromCodepoint(static_cast<uint32_t>(b), out);
    }
    return out;
}

Result<std::string> decodeUtf16(ByteSpan data, bool le, bool stripBom) {
    if (data.size() % 2 != 0) {
        return Error{ErrorCode::ChunkDecodeError, "Truncated UTF-16 data (odd byte count)"};
    }
    size_t i = 0;
    if (stripBom && data.size() >= 2 && utf16UnitAt(data, 0, le) == 0xFEFF) {
        i = 2;
    }

    std::string out;
    out.reserve(data.size());
    while (i < data.size()) {
        const uint16_t w = utf16UnitAt(data, i, le);
        const size_t at = i;
        i += 2;
        if (w >= 0xD800 && w <= 0xDBFF) {
            if (i >= data.size()) {
                return Error{ErrorCode::ChunkDecodeError,
                             "Unpaired high surrogate at byte " + std::to_string(at)};
            }
            const uint16_t w2 = utf16UnitAt(data, i, le);
            if (w2 < 0xDC00 || w2 > 0xDFFF) {
                return Error{ErrorCode::ChunkDecodeError,
                             "Unpaired high surrogate at byte " + std::to_string(at)};
            }
            i += 2;
            const uint32_t cp = 0x10000 + (((w - 0xD800u) << 10) | (w2 - 0xDC00u));
            appendUtf8FromCodepoint(cp, out);
        } else if (w >= 0xDC00 && w <= 0xDFFF) {
            return Error{ErrorCode::ChunkDecodeError,
                         "Stray low surrogate at byte " + std::to_string(at)};
        } else {
            appendUtf8FromCodepoint(w, out);
        }
    }
    return out;
}

} // namespace

std::optional<std::string> EncodingDetector::canonicalName(const std::string& encoding) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"utf8", "UTF-8"},          {"utf8sig", "UTF-8-SIG"},   {"ascii", "ascii"},
        {"usascii", "ascii"},       {"iso88591", "ISO-8859-1"}, {"latin1", "ISO-8859-1"},
        {"l1", "ISO-8859-1"},       {"utf16le", "UTF-16LE"},    {"utf16be", "UTF-16BE"}};

    std::string key;
    key.reserve(encoding.size());
    for (unsigned char c : encoding) {
        if (c == '-' || c == '_' || std::isspace(c))
            continue;
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    auto it = aliases.find(key);
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

EncodingGuess EncodingDetector::detect(ByteSpan data) {
    EncodingGuess guess;
    if (data.empty()) {
        return guess;
    }

    if (data.size() >= 3 && byteAt(data, 0) == 0xEF && byteAt(data, 1) == 0xBB &&
        byteAt(data, 2) == 0xBF) {
        return {"UTF-8-SIG", 1.0, false};
    }
    if (data.size() >= 2) {
        if (byteAt(data, 0) == 0xFF && byteAt(data, 1) == 0xFE) {
            return {"UTF-16LE", 1.0, false};
        }
        if (byteAt(data, 0) == 0xFE && byteAt(data, 1) == 0xFF) {
            return {"UTF-16BE", 1.0, false};
        }
    }

    guess.binary = looksBinary(data);

    const bool ascii =
        std::all_of(data.begin(), data.end(), [](std::byte b) { return b <= std::byte{0x7F}; });
    if (ascii) {
        guess.encoding = "ascii";
        guess.confidence = 1.0;
        return guess;
    }

    // A sample cut from a larger file may end in the middle of a character
    auto body = data.first(data.size() - utf8IncompleteTail(data));
    if (firstInvalidUtf8(body) == body.size()) {
        guess.encoding = "UTF-8";
        guess.confidence = 0.9;
        return guess;
    }

    guess.encoding = "ISO-8859-1"; // default fallback
    guess.confidence = 0.5;
    return guess;
}

std::string EncodingDetector::chooseEncoding(const EncodingGuess& guess, double threshold,
                                             const std::string& fallback) {
    if (guess.accepted(threshold)) {
        // A 7-bit sample says nothing about the rest of the file; UTF-8 decodes it identically
        return guess.encoding == "ascii" ? std::string("UTF-8") : guess.encoding;
    }
    return canonicalName(fallback).value_or(DEFAULT_ENCODING);
}

bool EncodingDetector::looksBinary(ByteSpan data) noexcept {
    if (data.empty()) {
        return false;
    }

    // Check for null bytes or high concentration of non-printable characters
    size_t nonPrintable = 0;
    const size_t checkSize = std::min(data.size(), size_t(8192));

    for (size_t i = 0; i < checkSize; ++i) {
        const uint8_t byte = byteAt(data, i);

        // Null byte is strong indicator of binary
        if (byte == 0) {
            return true;
        }

        // Count non-printable characters (excluding common whitespace)
        if (byte < 32 && byte != '\t' && byte != '\n' && byte != '\r') {
            nonPrintable++;
        }
    }

    // If more than 30% non-printable, consider binary
    return (nonPrintable * 100 / checkSize) > 30;
}

Result<std::string> EncodingDetector::decode(ByteSpan data, const std::string& encoding,
                                             bool atFileStart) {
    auto name = canonicalName(encoding);
    if (!name) {
        return Error{ErrorCode::NotSupported, "Unsupported encoding: " + encoding};
    }

    if (*name == "UTF-8" || *name == "UTF-8-SIG") {
        return decodeUtf8(data, atFileStart && *name == "UTF-8-SIG");
    }
    if (*name == "ascii") {
        return decodeAscii(data);
    }
    if (*name == "ISO-8859-1") {
        return decodeLatin1(data);
    }
    return decodeUtf16(data, *name == "UTF-16LE", atFileStart);
}

size_t EncodingDetector::incompleteTailLength(ByteSpan data, const std::string& encoding) {
    if (data.empty()) {
        return 0;
    }
    auto name = canonicalName(encoding);
    if (!name) {
        return 0;
    }
    if (*name == "UTF-8" || *name == "UTF-8-SIG") {
        return utf8IncompleteTail(data);
    }
    if (*name == "UTF-16LE" || *name == "UTF-16BE") {
        return utf16IncompleteTail(data, *name == "UTF-16LE");
    }
    return 0;
}

} // namespace peek::extraction

#pragma once

#include <optional>
#include <string>
#include <peek/core/types.h>

namespace peek::extraction {

/**
 * @brief Result of sniffing a byte sample
 */
struct EncodingGuess {
    std::string encoding; // Canonical name, empty when nothing could be guessed
    double confidence = 0.0;
    bool binary = false; // Sample looks like binary data rather than text

    [[nodiscard]] bool accepted(double threshold) const noexcept {
        return !encoding.empty() && confidence > threshold;
    }
};

/**
 * @brief Encoding detection and strict decoding to UTF-8
 *
 * Canonical names: "UTF-8", "UTF-8-SIG", "ascii", "ISO-8859-1", "UTF-16LE", "UTF-16BE".
 * Lookups are case-insensitive and ignore '-' and '_' ("utf8", "latin1" and "utf_16le" work).
 */
class EncodingDetector {
public:
    /**
     * @brief Detect text encoding from a buffer
     * @param data Data buffer to analyze (leading sample or whole file)
     * @return Best guess with confidence (0.0-1.0) and a binary hint
     */
    static EncodingGuess detect(ByteSpan data);

    /**
     * @brief Pick the session encoding: the guess if its confidence clears the threshold,
     * otherwise the fallback. An "ascii" guess is widened to "UTF-8".
     */
    static std::string chooseEncoding(const EncodingGuess& guess, double threshold,
                                      const std::string& fallback);

    /**
     * @brief Check if data is likely binary (NUL byte or >30% control characters)
     */
    static bool looksBinary(ByteSpan data) noexcept;

    /**
     * @brief Decode bytes to UTF-8 without substitution
     * @param atFileStart data begins at file offset 0; only then is a leading BOM stripped
     * @return Decoded text, ChunkDecodeError on malformed input, NotSupported for unknown names
     */
    static Result<std::string> decode(ByteSpan data, const std::string& encoding,
                                      bool atFileStart = true);

    /**
     * @brief Number of trailing bytes that start a multi-byte sequence the data does not finish
     *
     * Always 0 for single-byte encodings. Used to carry a split character into the next chunk.
     */
    static size_t incompleteTailLength(ByteSpan data, const std::string& encoding);

    /**
     * @brief Map an encoding name to its canonical spelling
     */
    static std::optional<std::string> canonicalName(const std::string& encoding);
};

} // namespace peek::extraction

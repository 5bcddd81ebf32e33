#include <spdlog/spdlog.h>
#include <peek/content/content_assembler.h>
#include <peek/content/hex_dump.h>
#include <peek/extraction/encoding_detector.h>

namespace peek::content {

std::optional<std::string> ContentAssembler::assemble(
    const LineCache& cache, const std::optional<ByteVector>& raw,
    const std::optional<std::string>& encoding) const {
    if (!cache.empty()) {
        return cache.join("\n");
    }

    if (!raw || raw->empty()) {
        return std::nullopt;
    }

    if (encoding) {
        auto decoded = extraction::EncodingDetector::decode(*raw, *encoding);
        if (decoded) {
            return std::move(decoded).value();
        }
        spdlog::debug("[ContentAssembler] Direct decode as {} failed ({}), falling back to hex",
                      *encoding, decoded.error().message);
    }

    return HexDump::format(*raw, bytesPerLine_);
}

} // namespace peek::content

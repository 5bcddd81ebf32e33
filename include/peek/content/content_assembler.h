#pragma once

#include <optional>
#include <string>
#include <peek/content/line_cache.h>
#include <peek/core/types.h>

namespace peek::content {

/**
 * @brief Builds the whole-content view of a session
 *
 * Order of preference: the cached lines joined with '\n'; a direct decode of the raw buffer
 * under the session encoding; a hex/ASCII dump of the raw buffer. With no cached lines and no
 * (or an empty) raw buffer there is nothing to show.
 */
class ContentAssembler {
public:
    explicit ContentAssembler(size_t bytesPerLine = DEFAULT_BYTES_PER_LINE)
        : bytesPerLine_(bytesPerLine) {}

    [[nodiscard]] std::optional<std::string>
    assemble(const LineCache& cache, const std::optional<ByteVector>& raw,
             const std::optional<std::string>& encoding) const;

private:
    size_t bytesPerLine_;
};

} // namespace peek::content

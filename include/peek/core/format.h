#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to fmt library

#if PEEK_HAS_STD_FORMAT
#include <format>
namespace peek {
using std::format;
using std::format_to;
} // namespace peek
#else
// Toolchains without <format> (e.g. GCC 12) use the {fmt} that spdlog carries
#include <spdlog/fmt/fmt.h>

namespace peek {
using fmt::format;
using fmt::format_to;
} // namespace peek
#endif

#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to the fmt library spdlog is built against

#if SCRY_HAS_STD_FORMAT
#include <format>
namespace scry {
using std::format;
using std::format_to;
using std::vformat;
} // namespace scry
#else
#include <spdlog/fmt/fmt.h>

namespace scry {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace scry
#endif

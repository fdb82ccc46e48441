#pragma once

#include <string_view>
#include <vector>

#include <scry/detect/finding.h>

namespace scry::detect {

/**
 * @brief Per-line text checks that need no syntax tree
 *
 * hardcoded-secret (CRITICAL): `api_key|secret|password|token = "<8+ token chars>"`
 * leftover-todo (LOW): a `#` or `//` comment starting with TODO, FIXME or XXX
 */
std::vector<Finding> scanLines(std::string_view file, const std::vector<std::string_view>& lines);

} // namespace scry::detect

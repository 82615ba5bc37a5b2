#pragma once

#include <string>

namespace tagmv::util {

/// Turn an arbitrary tag string into a single filesystem-safe path segment.
///
/// - '/' and '\' become '-'
/// - ':' '*' '?' '"' '<' '>' '|' and control characters (Unicode Cc) are removed
/// - runs of Unicode whitespace collapse to one space
/// - leading/trailing dots and spaces are trimmed
/// - Windows device names (CON, NUL, COM1, ...) get a '_' prefix
///
/// Never returns an empty string: an empty result becomes "Unknown".
std::string sanitize(const std::string& raw);

/// ASCII whitespace trim, used to decide whether a tag field is present.
std::string trim(const std::string& str);

}  // namespace tagmv::util

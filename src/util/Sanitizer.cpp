#include "util/Sanitizer.hpp"
#include <array>
#include <string_view>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace tagmv::util {

namespace {
    constexpr std::array<std::string_view, 22> RESERVED_NAMES = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
    };

    constexpr std::string_view FALLBACK_NAME = "Unknown";

    bool is_removed(UChar32 c) {
        switch (c) {
            case ':': case '*': case '?': case '"':
            case '<': case '>': case '|':
                return true;
            default:
                return u_charType(c) == U_CONTROL_CHAR;
        }
    }

    bool equals_ignore_ascii_case(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'a' && ca <= 'z') ca = static_cast<char>(ca - 'a' + 'A');
            if (cb >= 'a' && cb <= 'z') cb = static_cast<char>(cb - 'a' + 'A');
            if (ca != cb) return false;
        }
        return true;
    }
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string sanitize(const std::string& raw) {
    // fromUTF8 maps invalid byte sequences to U+FFFD
    icu::UnicodeString input = icu::UnicodeString::fromUTF8(raw);
    icu::UnicodeString collapsed;
    bool pending_space = false;

    for (int32_t i = 0; i < input.length();) {
        UChar32 c = input.char32At(i);
        i += U16_LENGTH(c);

        if (c == '/' || c == '\\') {
            c = '-';
        } else if (is_removed(c)) {
            continue;
        }

        if (u_isUWhiteSpace(c)) {
            pending_space = !collapsed.isEmpty();
            continue;
        }
        if (pending_space) {
            collapsed.append(static_cast<UChar>(' '));
            pending_space = false;
        }
        collapsed.append(c);
    }

    // Trim dots and spaces at both ends
    int32_t start = 0;
    int32_t end = collapsed.length();
    while (start < end && (collapsed.charAt(start) == '.' || collapsed.charAt(start) == ' ')) ++start;
    while (end > start && (collapsed.charAt(end - 1) == '.' || collapsed.charAt(end - 1) == ' ')) --end;

    std::string result;
    collapsed.tempSubStringBetween(start, end).toUTF8String(result);

    if (result.empty()) {
        return std::string(FALLBACK_NAME);
    }

    for (const auto& reserved : RESERVED_NAMES) {
        if (equals_ignore_ascii_case(result, reserved)) {
            return "_" + result;
        }
    }
    return result;
}

}  // namespace tagmv::util

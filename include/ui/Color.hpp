#pragma once

#include <cstdint>
#include <string>

namespace tagmv::ui {

enum class Color : uint32_t {
    Default = 0,
    // Numbered after the ANSI palette: code 30 + value - 1
    Red = 2,
    Green = 3,
    Yellow = 4,
};

enum class Attribute : uint8_t {
    None = 0,
    Bold = 1 << 0,
    Dim = 1 << 1,
};

inline bool has_attribute(Attribute set, Attribute check) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(check)) != 0;
}

struct Style {
    Color fg = Color::Default;
    Attribute attr = Attribute::None;

    bool operator==(const Style& other) const = default;
};

// Wrap text in ANSI escape codes for `style`; plain text when disabled.
inline std::string paint(const std::string& text, const Style& style, bool enabled) {
    if (!enabled || (style.fg == Color::Default && style.attr == Attribute::None)) {
        return text;
    }

    std::string output;
    if (style.fg != Color::Default) {
        int fg_code = 30 + static_cast<int>(style.fg) - 1;
        output += "\033[" + std::to_string(fg_code) + "m";
    }
    if (has_attribute(style.attr, Attribute::Bold)) {
        output += "\033[1m";
    }
    if (has_attribute(style.attr, Attribute::Dim)) {
        output += "\033[2m";
    }

    output += text;
    output += "\033[0m";  // Reset
    return output;
}

} // namespace tagmv::ui

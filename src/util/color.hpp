#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fuzzpatch {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        DefaultColor,
        Reset
    };

    Kind kind;

    // SGR parameter for foreground and background
    uint8_t fg;
    uint8_t bg;

    bool operator==(const TermColor& other) const {
        return other.kind == kind && other.fg == fg && other.bg == bg;
    }

    // Escape sequence selecting this color as foreground, optionally in bold.
    std::string
    to_ansi(bool bold = false) const;

    // Palette names; i.e "red", "light_yellow", "default"
    static std::optional<TermColor>
    from_string(const std::string& name);

    static const TermColor kReset;
    static const TermColor kDefault;

    // Colors (standard 4 bit palette)
    static const TermColor kRed;
    static const TermColor kGreen;
    static const TermColor kYellow;
    static const TermColor kCyan;
    static const TermColor kDarkGray;
    static const TermColor kLightRed;
    static const TermColor kLightGreen;
    static const TermColor kLightYellow;
};

std::string
repr(const TermColor& color);

}  // namespace fuzzpatch

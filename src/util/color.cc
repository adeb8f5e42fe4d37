#include "color.hpp"

#include <fmt/format.h>

#include <unordered_map>

using namespace fuzzpatch;

// clang-format off
const TermColor TermColor::kReset   = TermColor { TermColor::Kind::Reset, 0, 0 };
const TermColor TermColor::kDefault = TermColor { TermColor::Kind::DefaultColor, 39, 49 };

const TermColor TermColor::kRed         = TermColor { TermColor::Kind::Color4bit, 31,  41 };
const TermColor TermColor::kGreen       = TermColor { TermColor::Kind::Color4bit, 32,  42 };
const TermColor TermColor::kYellow      = TermColor { TermColor::Kind::Color4bit, 33,  43 };
const TermColor TermColor::kCyan        = TermColor { TermColor::Kind::Color4bit, 36,  46 };
const TermColor TermColor::kDarkGray    = TermColor { TermColor::Kind::Color4bit, 90, 100 };
const TermColor TermColor::kLightRed    = TermColor { TermColor::Kind::Color4bit, 91, 101 };
const TermColor TermColor::kLightGreen  = TermColor { TermColor::Kind::Color4bit, 92, 102 };
const TermColor TermColor::kLightYellow = TermColor { TermColor::Kind::Color4bit, 93, 103 };

namespace {

const std::unordered_map<std::string, TermColor> kColorNames = {
        { "reset",        TermColor::kReset },
        { "default",      TermColor::kDefault },
        { "red",          TermColor::kRed },
        { "green",        TermColor::kGreen },
        { "yellow",       TermColor::kYellow },
        { "cyan",         TermColor::kCyan },
        { "dark_gray",    TermColor::kDarkGray },
        { "light_red",    TermColor::kLightRed },
        { "light_green",  TermColor::kLightGreen },
        { "light_yellow", TermColor::kLightYellow },
};
// clang-format on

}  // namespace

std::string
TermColor::to_ansi(bool bold) const {
    switch (kind) {
        case Kind::Reset:
            return "\033[0m";
        case Kind::DefaultColor:
            /* fall-through */
        case Kind::Color4bit: {
            if (bold) {
                return fmt::format("\033[1;{}m", fg);
            }
            return fmt::format("\033[{}m", fg);
        }
    }
    return "";
}

std::optional<TermColor>
TermColor::from_string(const std::string& name) {
    auto it = kColorNames.find(name);
    if (it == kColorNames.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string
fuzzpatch::repr(const TermColor& color) {
    for (const auto& [name, value] : kColorNames) {
        if (value == color) {
            return name;
        }
    }
    return fmt::format("TermColor(fg={}, bg={})", color.fg, color.bg);
}

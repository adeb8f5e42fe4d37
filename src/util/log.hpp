#pragma once

/*
    Leveled diagnostics on stderr.

    Messages are formatted with fmt and prefixed with their level tag. The tag
    is colored when stderr is a color capable terminal. Tests and embedders can
    redirect output with `log_set_sink`.
*/

#include "util/color.hpp"

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace fuzzpatch {

enum class LogLevel {
    kDebug = 0,
    kInfo,
    kWarning,
    kError,
    kQuiet,
};

std::string
to_string(LogLevel level);

std::optional<LogLevel>
log_level_from_string(const std::string& s);

void
log_set_level(LogLevel level);

LogLevel
log_get_level();

// Probe stderr and enable colored level tags if supported. `allow_color`
// false forces plain output.
void
log_init(bool allow_color);

void
log_set_level_color(LogLevel level, TermColor color);

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Replace the stderr writer. Pass an empty function to restore it.
void
log_set_sink(LogSink sink);

void
log_write(LogLevel level, const std::string& message);

inline bool
log_enabled(LogLevel level) {
    return level >= log_get_level() && level != LogLevel::kQuiet;
}

template <typename... Args>
void
log_debug(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::kDebug)) {
        log_write(LogLevel::kDebug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_info(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::kInfo)) {
        log_write(LogLevel::kInfo, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_warning(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::kWarning)) {
        log_write(LogLevel::kWarning, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_error(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::kError)) {
        log_write(LogLevel::kError, fmt::format(format, std::forward<Args>(args)...));
    }
}

}  // namespace fuzzpatch

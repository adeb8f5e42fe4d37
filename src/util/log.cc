#include "log.hpp"

#include "util/tty.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdio>

#ifdef FUZZPATCH_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace fuzzpatch;

namespace {

struct LogState {
    LogLevel level = LogLevel::kInfo;
    bool color = false;
    LogSink sink;

    // Indexed by LogLevel, kQuiet excluded
    std::array<TermColor, 4> colors = {
        TermColor::kDarkGray,
        TermColor::kCyan,
        TermColor::kYellow,
        TermColor::kLightRed,
    };
};

LogState&
state() {
    static LogState s;
    return s;
}

int
stderr_fd() {
#ifdef FUZZPATCH_PLATFORM_POSIX
    return STDERR_FILENO;
#else
    return 2;
#endif
}

}  // namespace

std::string
fuzzpatch::to_string(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarning:
            return "warning";
        case LogLevel::kError:
            return "error";
        case LogLevel::kQuiet:
            return "quiet";
    }
    return "unknown";
}

std::optional<LogLevel>
fuzzpatch::log_level_from_string(const std::string& s) {
    if (s == "debug")
        return LogLevel::kDebug;
    else if (s == "info")
        return LogLevel::kInfo;
    else if (s == "warning" || s == "warn")
        return LogLevel::kWarning;
    else if (s == "error")
        return LogLevel::kError;
    else if (s == "quiet" || s == "none")
        return LogLevel::kQuiet;
    return std::nullopt;
}

void
fuzzpatch::log_set_level(LogLevel level) {
    state().level = level;
}

LogLevel
fuzzpatch::log_get_level() {
    return state().level;
}

void
fuzzpatch::log_init(bool allow_color) {
    state().color = allow_color && (tty_get_capabilities(stderr_fd()) & TermColorSupport_Ansi4bit) != 0;
}

void
fuzzpatch::log_set_level_color(LogLevel level, TermColor color) {
    if (level == LogLevel::kQuiet) {
        return;
    }
    state().colors[static_cast<size_t>(level)] = color;
}

void
fuzzpatch::log_set_sink(LogSink sink) {
    state().sink = std::move(sink);
}

void
fuzzpatch::log_write(LogLevel level, const std::string& message) {
    if (level == LogLevel::kQuiet) {
        return;
    }

    auto& s = state();
    if (s.sink) {
        s.sink(level, message);
        return;
    }

    const std::string tag = to_string(level);
    if (s.color) {
        const auto& color = s.colors[static_cast<size_t>(level)];
        fmt::print(stderr, "{}{}:{} {}\n", color.to_ansi(level >= LogLevel::kWarning), tag,
                   TermColor::kReset.to_ansi(), message);
    } else {
        fmt::print(stderr, "{}: {}\n", tag, message);
    }
}

#include "tty.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef FUZZPATCH_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace fuzzpatch;

bool
fuzzpatch::tty_is_terminal(int fd) {
#ifdef FUZZPATCH_PLATFORM_POSIX
    return isatty(fd) != 0;
#else
    (void) fd;
    return false;
#endif
}

uint16_t
fuzzpatch::tty_get_capabilities(int fd) {
#ifdef FUZZPATCH_PLATFORM_POSIX
    // Logs redirected to a file or a pipe never get escape codes.
    if (!tty_is_terminal(fd)) {
        return TermColorSupport_None;
    }

    // https://no-color.org
    if (getenv("NO_COLOR") != nullptr) {
        return TermColorSupport_None;
    }

    const char* term_var = getenv("TERM");
    if (term_var == nullptr || std::string(term_var) == "dumb") {
        return TermColorSupport_None;
    }

    // The COLORTERM variable is usually available to indicate 24bit color support.
    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            return TermColorSupport_Ansi24bit | TermColorSupport_Ansi8bit | TermColorSupport_Ansi4bit;
        }
    }

    // And if that's not supported, fall back to checking terminfo with tput.
    FILE* pipe = popen("tput colors 2>&1", "r");  // stderr isn't captured, so redirect it to stdout.
    if (pipe) {
        char buffer[16];
        bool buffer_valid = fgets(buffer, 16, pipe) != nullptr;
        pclose(pipe);
        if (buffer_valid) {
            // NOTE: atoi returns 0 on failure
            int colors = std::atoi(buffer);
            if (colors >= 256) {
                return TermColorSupport_Ansi8bit | TermColorSupport_Ansi4bit;
            }
            if (colors >= 8) {
                return TermColorSupport_Ansi4bit;
            }
        }
    }
#else
    (void) fd;
#endif
    return TermColorSupport_None;
}

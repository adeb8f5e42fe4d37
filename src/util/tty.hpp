#pragma once

#include <cstdint>

namespace fuzzpatch {

const uint16_t TermColorSupport_None      = 0;
const uint16_t TermColorSupport_Ansi4bit  = 1;  // 16 color palette
const uint16_t TermColorSupport_Ansi8bit  = 2;  // 256 color palette
const uint16_t TermColorSupport_Ansi24bit = 4;  // 24 bit true color

bool
tty_is_terminal(int fd);

// Color support of the terminal attached to `fd`. Anything that isn't a
// terminal reports `TermColorSupport_None`.
uint16_t
tty_get_capabilities(int fd);

}  // namespace fuzzpatch

#pragma once

#include <cstdio>
#include <string>
#include <vector>

namespace fuzzpatch {

// A text file as a line buffer. Lines never contain their line terminator;
// the terminator style and whether the last line was terminated are kept
// alongside so the file can be written back unchanged.
struct TextFile {
    std::vector<std::string> lines;
    std::string eol = "\n";
    bool final_newline = true;
};

// Split on '\n', dropping a '\r' before it. A terminator at the very end does
// not produce an extra empty line; "" gives no lines.
std::vector<std::string>
split_lines(const std::string& text);

std::string
join_lines(const std::vector<std::string>& lines, const std::string& eol = "\n", bool final_newline = false);

void
parse_text(const std::string& text, TextFile& file);

bool
read_text_file(const std::string& path, TextFile& file);

// Read until end of stream, i.e. stdin.
bool
read_text_stream(FILE* stream, TextFile& file);

// Replaces `path` as a whole; on failure the previous content is untouched.
bool
write_text_file(const std::string& path, const TextFile& file);

}  // namespace fuzzpatch

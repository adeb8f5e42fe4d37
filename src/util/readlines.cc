#include "readlines.hpp"

#include "util/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

using namespace fuzzpatch;

namespace internal {

bool
read_all(FILE* stream, std::string& out) {
    char buffer[4096];
    while (true) {
        size_t n = fread(buffer, 1, sizeof(buffer), stream);
        if (n > 0) {
            out.append(buffer, n);
        }
        if (n < sizeof(buffer)) {
            break;
        }
    }
    return ferror(stream) == 0;
}

}  // namespace internal

std::vector<std::string>
fuzzpatch::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        auto length = end - start;
        if (length > 0 && text[end - 1] == '\r') {
            length--;
        }
        lines.push_back(text.substr(start, length));
        start = end + 1;
    }
    return lines;
}

std::string
fuzzpatch::join_lines(const std::vector<std::string>& lines, const std::string& eol, bool final_newline) {
    std::string text;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            text += eol;
        }
        text += lines[i];
    }
    if (final_newline && !lines.empty()) {
        text += eol;
    }
    return text;
}

void
fuzzpatch::parse_text(const std::string& text, TextFile& file) {
    file.lines = split_lines(text);

    // The first terminator decides the style of the whole file.
    auto first_lf = text.find('\n');
    file.eol = (first_lf != std::string::npos && first_lf > 0 && text[first_lf - 1] == '\r') ? "\r\n" : "\n";
    file.final_newline = text.empty() || text.back() == '\n';
}

bool
fuzzpatch::read_text_file(const std::string& path, TextFile& file) {
    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        log_debug("failed to open '{}' for reading: {}", path, strerror(errno));
        return false;
    }

    std::string text;
    bool ok = internal::read_all(stream, text);
    fclose(stream);
    if (!ok) {
        log_debug("failed to read '{}'", path);
        return false;
    }

    parse_text(text, file);
    return true;
}

bool
fuzzpatch::read_text_stream(FILE* stream, TextFile& file) {
    std::string text;
    if (!internal::read_all(stream, text)) {
        log_debug("failed to read stream: {}", strerror(errno));
        return false;
    }
    parse_text(text, file);
    return true;
}

// Write to a sibling temporary file and rename it over the target, so a
// failed write never leaves a truncated file behind.
bool
fuzzpatch::write_text_file(const std::string& path, const TextFile& file) {
    namespace fs = std::filesystem;

    const std::string temp_path = path + ".fuzzpatch-tmp";
    FILE* stream = fopen(temp_path.c_str(), "wb");
    if (!stream) {
        log_debug("failed to open '{}' for writing: {}", temp_path, strerror(errno));
        return false;
    }

    std::string text = join_lines(file.lines, file.eol, file.final_newline);
    bool ok = text.empty() || fwrite(text.data(), text.size(), 1, stream) == 1;
    if (fflush(stream) != 0) {
        ok = false;
    }
    if (fclose(stream) != 0) {
        ok = false;
    }
    if (!ok) {
        log_debug("failed to write '{}': {}", temp_path, strerror(errno));
    }

    std::error_code ec;
    if (ok) {
        // Keep the mode of the file being replaced
        auto status = fs::status(path, ec);
        if (!ec && fs::exists(status)) {
            fs::permissions(temp_path, status.permissions(), ec);
        }
        ec.clear();

        fs::rename(temp_path, path, ec);
        if (ec) {
            log_debug("failed to replace '{}': {}", path, ec.message());
            ok = false;
        }
    }

    if (!ok) {
        fs::remove(temp_path, ec);
    }
    return ok;
}

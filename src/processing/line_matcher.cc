#include "line_matcher.hpp"

using namespace fuzzpatch;

namespace {

bool
is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string
right_trim(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\f\v");
    return (end == std::string::npos) ? std::string() : s.substr(0, end + 1);
}

std::string
left_trim(const std::string& s) {
    std::string::size_type i = 0;
    while (i < s.size() && is_blank(s[i]))
        i++;
    return s.substr(i);
}

bool
starts_comment(const std::string& line, std::string::size_type pos, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        if (!marker.empty() && line.compare(pos, marker.size(), marker) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string
fuzzpatch::strip_trailing_comment(const std::string& line, const std::vector<std::string>& comment_markers) {
    char quote = 0;
    for (std::string::size_type i = 0; i < line.size(); i++) {
        const char c = line[i];
        if (quote) {
            if (c == '\\') {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        if (c == '"' || c == '\'') {
            quote = c;
        } else if (starts_comment(line, i, comment_markers)) {
            return right_trim(line.substr(0, i));
        }
    }

    return right_trim(line);
}

bool
fuzzpatch::lines_match(const std::string& expected, const std::string& actual, const MatchOptions& options) {
    if (expected == actual) {
        return true;
    }
    if (options.fuzziness < 1) {
        return false;
    }

    auto a = strip_trailing_comment(expected, options.comment_markers);
    auto b = strip_trailing_comment(actual, options.comment_markers);
    if (a == b) {
        return true;
    }
    if (options.fuzziness < 2) {
        return false;
    }

    return left_trim(a) == left_trim(b);
}

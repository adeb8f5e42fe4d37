#pragma once

/*
    Line comparison under a tolerance level.

    Models often reproduce a source line without its trailing comment, with
    a comment the source doesn't have, or with shifted indentation. The
    fuzziness level decides which of those differences are ignored:

        0   lines must be identical
        1   trailing whitespace and a trailing comment are ignored
        2   leading whitespace is ignored as well
*/

#include <string>
#include <vector>

namespace fuzzpatch {

const int kMaxFuzziness = 2;

struct MatchOptions {
    int fuzziness = 0;

    // Strings that open a comment running to the end of the line.
    std::vector<std::string> comment_markers = {"#"};
};

// Remove a trailing comment that isn't inside a string literal, then any
// trailing whitespace. Lines with an unterminated string literal only lose
// their trailing whitespace.
std::string
strip_trailing_comment(const std::string& line, const std::vector<std::string>& comment_markers);

bool
lines_match(const std::string& expected, const std::string& actual, const MatchOptions& options);

}  // namespace fuzzpatch

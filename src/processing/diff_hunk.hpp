#pragma once

/*
    One edit operation parsed out of a unified diff.

    `match` holds the lines expected in the original file (context and removed
    lines), `replace` the lines that should be there afterwards (context and
    added lines). Header line numbers are advisory; hunks are located by
    content.
*/

#include "processing/line_matcher.hpp"

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fuzzpatch {

struct Hunk {
    // Context lines kept on each side of the edited lines.
    static constexpr int64_t kMaxContext = 3;

    Hunk() = default;

    // `header` is the "@@" line, `body` the lines following it up to the next
    // header or file marker.
    Hunk(const std::string& header, gsl::span<const std::string> body);

    // 1-based, nullopt for placeholder headers.
    std::optional<int64_t> start_original;
    std::optional<int64_t> count_original;
    std::optional<int64_t> start_new;
    std::optional<int64_t> count_new;

    std::vector<std::string> match;
    std::vector<std::string> replace;

    std::optional<std::string> filename;
    bool is_new_file = false;
    bool is_deleted_file = false;

    int64_t
    match_count() const;

    int64_t
    replace_count() const;

    bool
    empty() const;

    // Does `match` line up with `code_lines` starting at `index`?
    bool
    matches_code(const std::vector<std::string>& code_lines, int64_t index, int fuzziness) const;
    bool
    matches_code(const std::vector<std::string>& code_lines, int64_t index, const MatchOptions& options) const;

    // Search outward from the declared start line for the nearest index where
    // the hunk matches.
    std::optional<int64_t>
    match_code(const std::vector<std::string>& code_lines, int fuzziness) const;
    std::optional<int64_t>
    match_code(const std::vector<std::string>& code_lines, const MatchOptions& options) const;
    std::optional<int64_t>
    match_code(const std::vector<std::string>& code_lines, int64_t origin, const MatchOptions& options) const;
};

std::string
repr(const Hunk& hunk);

}  // namespace fuzzpatch

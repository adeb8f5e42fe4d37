#include "diff_hunk.hpp"

#include "processing/diff_classifier.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace fuzzpatch;

namespace {

// Number of leading (or trailing) positions where match and replace agree.
int64_t
count_common_context(const std::vector<std::string>& match,
                     const std::vector<std::string>& replace,
                     bool from_back) {
    const size_t n = std::min(match.size(), replace.size());
    int64_t count = 0;
    for (size_t i = 0; i < n; i++) {
        const auto& a = from_back ? match[match.size() - 1 - i] : match[i];
        const auto& b = from_back ? replace[replace.size() - 1 - i] : replace[i];
        if (a != b) {
            break;
        }
        count++;
    }
    return count;
}

// Drop context beyond Hunk::kMaxContext from both ends. The back is only
// looked at when both sides still have lines after trimming the front.
// Returns the number of lines dropped from the front.
int64_t
trim_context(std::vector<std::string>& match, std::vector<std::string>& replace) {
    const int64_t front = std::max<int64_t>(count_common_context(match, replace, false) - Hunk::kMaxContext, 0);
    if (front > 0) {
        log_debug("Trimming {} leading context lines", front);
        match.erase(match.begin(), match.begin() + front);
        replace.erase(replace.begin(), replace.begin() + front);
    }

    if (match.empty() || replace.empty()) {
        return front;
    }

    const int64_t trailing = count_common_context(match, replace, true);
    if (trailing > Hunk::kMaxContext) {
        const auto trim = trailing - Hunk::kMaxContext;
        log_debug("Trimming {} trailing context lines", trim);
        match.erase(match.end() - trim, match.end());
        replace.erase(replace.end() - trim, replace.end());
    }
    return front;
}

}  // namespace

Hunk::Hunk(const std::string& header, gsl::span<const std::string> body) {
    if (auto parsed = parse_hunk_header(header)) {
        start_original = parsed->start_original;
        count_original = parsed->count_original;
        start_new = parsed->start_new;
        count_new = parsed->count_new;
    }

    // Empty lines at the end are most likely the blank line between the
    // diff and whatever follows it.
    size_t body_size = body.size();
    while (body_size > 0 && body[body_size - 1].empty()) {
        body_size--;
    }

    for (size_t i = 0; i < body_size; i++) {
        const std::string& line = body[i];
        if (line.empty()) {
            match.emplace_back();
            replace.emplace_back();
            continue;
        }

        switch (line[0]) {
            case '+': {
                replace.push_back(line.substr(1));
            } break;
            case '-': {
                match.push_back(line.substr(1));
            } break;
            case ' ': {
                match.push_back(line.substr(1));
                replace.push_back(line.substr(1));
            } break;
            case '\\': {
                // "\ No newline at end of file"
            } break;
            default: {
                // Context line that lost its leading space
                match.push_back(line);
                replace.push_back(line);
            } break;
        }
    }

    // Declared start lines follow the first kept line.
    const int64_t dropped = trim_context(match, replace);
    if (dropped > 0) {
        if (start_original) {
            *start_original += dropped;
        }
        if (start_new) {
            *start_new += dropped;
        }
    }
}

int64_t
Hunk::match_count() const {
    return static_cast<int64_t>(match.size());
}

int64_t
Hunk::replace_count() const {
    return static_cast<int64_t>(replace.size());
}

bool
Hunk::empty() const {
    return match.empty();
}

bool
Hunk::matches_code(const std::vector<std::string>& code_lines, int64_t index, int fuzziness) const {
    MatchOptions options;
    options.fuzziness = fuzziness;
    return matches_code(code_lines, index, options);
}

bool
Hunk::matches_code(const std::vector<std::string>& code_lines, int64_t index, const MatchOptions& options) const {
    const auto code_count = static_cast<int64_t>(code_lines.size());
    if (index < 0 || index + match_count() > code_count) {
        return false;
    }

    for (int64_t i = 0; i < match_count(); i++) {
        const auto& code_line = code_lines[static_cast<size_t>(index + i)];
        const auto& patch_line = match[static_cast<size_t>(i)];
        if (!lines_match(patch_line, code_line, options)) {
            if (i > 3) {
                log_debug("Matched {}/{} lines starting from line {}, broke at line {}", i, match_count(),
                          index + 1, index + i + 1);
                log_debug("  src: {}$", code_line);
                log_debug(" diff: {}$", patch_line);
            }
            return false;
        }
    }
    return true;
}

std::optional<int64_t>
Hunk::match_code(const std::vector<std::string>& code_lines, int fuzziness) const {
    MatchOptions options;
    options.fuzziness = fuzziness;
    return match_code(code_lines, options);
}

std::optional<int64_t>
Hunk::match_code(const std::vector<std::string>& code_lines, const MatchOptions& options) const {
    const int64_t origin = start_original ? *start_original - 1 : 0;
    return match_code(code_lines, origin, options);
}

std::optional<int64_t>
Hunk::match_code(const std::vector<std::string>& code_lines, int64_t origin, const MatchOptions& options) const {
    const int64_t last = static_cast<int64_t>(code_lines.size()) - match_count();
    if (last < 0) {
        return std::nullopt;
    }

    origin = std::clamp<int64_t>(origin, 0, last);
    for (int64_t distance = 0; origin - distance >= 0 || origin + distance <= last; distance++) {
        const int64_t after = origin + distance;
        if (after <= last && matches_code(code_lines, after, options)) {
            return after;
        }
        const int64_t before = origin - distance;
        if (distance > 0 && before >= 0 && matches_code(code_lines, before, options)) {
            return before;
        }
    }
    return std::nullopt;
}

std::string
fuzzpatch::repr(const Hunk& hunk) {
    auto opt = [](const std::optional<int64_t>& v) { return v ? fmt::format("{}", *v) : std::string("none"); };
    return fmt::format("Hunk(file={}, start_original={}, start_new={}, match_count={}, replace_count={}{}{})",
                       hunk.filename ? *hunk.filename : std::string("none"), opt(hunk.start_original),
                       opt(hunk.start_new), hunk.match_count(), hunk.replace_count(),
                       hunk.is_new_file ? ", new" : "", hunk.is_deleted_file ? ", deleted" : "");
}

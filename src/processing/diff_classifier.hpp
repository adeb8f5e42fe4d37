#pragma once

/*
    Decide whether text is a unified diff.

    Two header forms are recognized:

        @@ -12,4 +12,5 @@     counted; the counts are optional ("@@ -3 +3 @@")
        @@ ... @@             placeholder; no numbers at all

    Placeholder headers come from models that don't bother computing line
    numbers. Hunks under such headers can only be located by content.
*/

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>

namespace fuzzpatch {

struct HunkHeader {
    int64_t start_original = 0;
    std::optional<int64_t> count_original;
    int64_t start_new = 0;
    std::optional<int64_t> count_new;
};

// Line numbers and counts above this are rejected.
const int64_t kMaxHeaderNumber = INT32_MAX;

// Parse a counted hunk header. Anything after the closing "@@" (git puts the
// enclosing function there) is ignored. Returns nullopt when a number is
// above kMaxHeaderNumber.
std::optional<HunkHeader>
parse_hunk_header(const std::string& line);

bool
is_placeholder_hunk_header(const std::string& line);

bool
is_unified_diff(gsl::span<const std::string> lines);

bool
is_unified_diff_no_counts(gsl::span<const std::string> lines);

}  // namespace fuzzpatch

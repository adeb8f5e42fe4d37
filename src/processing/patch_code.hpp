#pragma once

/*
    Apply diff hunks to a single in-memory file.

    Hunks are applied in diff order. Each one is located by content, starting
    at its declared line shifted by what earlier hunks added or removed, and
    retried at increasing fuzziness up to the requested level. Either every
    hunk applies or the buffer is left untouched.
*/

#include "processing/diff_hunk.hpp"
#include "processing/line_matcher.hpp"

#include <gsl/span>

#include <string>
#include <vector>

namespace fuzzpatch {

// Filename markers in `patch_lines` are ignored.
bool
patch_code(std::vector<std::string>& code_lines, gsl::span<const std::string> patch_lines, int fuzziness);

bool
patch_code(std::vector<std::string>& code_lines,
           gsl::span<const std::string> patch_lines,
           const MatchOptions& options);

bool
apply_hunks(std::vector<std::string>& code_lines, gsl::span<const Hunk> hunks, const MatchOptions& options);

}  // namespace fuzzpatch

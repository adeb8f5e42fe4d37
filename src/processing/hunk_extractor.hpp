#pragma once

/*
    Split unified diff text into hunks.

    The scanner is a small state machine:

        state           line                action
        -----------------------------------------------------------------------
        InHunk          --- / +++ / @@      close hunk, remember old path
        InHunk          --- <x> otherwise   body line (removed "-- x")
        InHunk          +++ <x>             body line (added "++ x")
        other           --- <path>          remember old path
        other           +++ <path>          set current file
        any             diff --git a/X b/Y  close hunk, set current file to Y
        any             @@ ...              close hunk, open a new one
        InHunk          anything else       body line
        Seeking         anything else       ignored
        InFileHeader    anything else       ignored

    Inside a hunk, "---" only starts a new file when the next line is "+++"
    and the one after that is "@@" (or the end of input, for a new or deleted
    file). Outside a hunk, a "---" without a following "+++" still names the
    file for the hunks after it. A new or deleted file header followed by no
    hunk at all produces one empty hunk for that file, so an empty file can
    still be created.

    Hunks appearing before any file marker have no filename.
*/

#include "processing/diff_hunk.hpp"

#include <gsl/span>

#include <optional>
#include <string>
#include <vector>

namespace fuzzpatch {

enum class ExtractorState {
    kSeeking,
    kInFileHeader,
    kInHunk,
};

std::string
to_string(ExtractorState state);

struct MarkerPath {
    std::optional<std::string> path;  // nullopt when the marker had no path
    bool is_null_device = false;
};

// Path of a "---" or "+++" line, without "a/" or "b/" prefix and trailing
// timestamp.
MarkerPath
parse_marker_path(const std::string& line);

std::vector<Hunk>
extract_hunks(gsl::span<const std::string> lines);

}  // namespace fuzzpatch

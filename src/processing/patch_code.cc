#include "patch_code.hpp"

#include "processing/hunk_extractor.hpp"
#include "util/log.hpp"

#include <algorithm>

using namespace fuzzpatch;

namespace {

// Where a hunk without any match lines goes. "@@ -5,0 +6,2 @@" inserts after
// line 5; with a non-zero original count the start line itself is the spot.
std::optional<int64_t>
insertion_point(const Hunk& hunk, const std::vector<std::string>& buffer, int64_t delta) {
    const auto size = static_cast<int64_t>(buffer.size());
    if (!hunk.start_original) {
        if (buffer.empty()) {
            return 0;
        }
        return std::nullopt;
    }

    const bool after_start = hunk.count_original && *hunk.count_original == 0;
    const int64_t base = after_start ? *hunk.start_original : *hunk.start_original - 1;
    return std::clamp<int64_t>(base + delta, 0, size);
}

std::optional<int64_t>
locate(const Hunk& hunk, const std::vector<std::string>& buffer, int64_t delta, const MatchOptions& options) {
    const int64_t origin = hunk.start_original ? *hunk.start_original - 1 + delta : 0;
    const int max_level = std::clamp(options.fuzziness, 0, kMaxFuzziness);

    for (int level = 0; level <= max_level; level++) {
        MatchOptions attempt = options;
        attempt.fuzziness = level;
        auto index = hunk.match_code(buffer, origin, attempt);
        if (index) {
            if (level > 0) {
                log_info("Hunk matched at line {} with fuzziness {}", *index + 1, level);
            }
            return index;
        }
        if (level < max_level) {
            log_debug("Can't locate hunk, retrying with fuzziness {}", level + 1);
        }
    }
    return std::nullopt;
}

}  // namespace

bool
fuzzpatch::apply_hunks(std::vector<std::string>& code_lines, gsl::span<const Hunk> hunks, const MatchOptions& options) {
    // Work on a copy so a failing hunk leaves the caller's buffer untouched.
    std::vector<std::string> buffer = code_lines;
    int64_t delta = 0;

    for (size_t i = 0; i < hunks.size(); i++) {
        const Hunk& hunk = hunks[i];
        if (hunk.match.empty() && hunk.replace.empty()) {
            log_debug("Skipping hunk {} without lines", i + 1);
            continue;
        }

        std::optional<int64_t> index;
        if (hunk.match.empty()) {
            index = insertion_point(hunk, buffer, delta);
        } else {
            index = locate(hunk, buffer, delta, options);
        }

        if (!index) {
            log_error("Can't apply hunk {}/{}: {}", i + 1, hunks.size(), repr(hunk));
            return false;
        }

        log_debug("Applying hunk {}/{} at line {}", i + 1, hunks.size(), *index + 1);
        auto first = buffer.begin() + *index;
        auto last = first + hunk.match_count();
        first = buffer.erase(first, last);
        buffer.insert(first, hunk.replace.begin(), hunk.replace.end());
        delta += hunk.replace_count() - hunk.match_count();
    }

    code_lines = std::move(buffer);
    return true;
}

bool
fuzzpatch::patch_code(std::vector<std::string>& code_lines, gsl::span<const std::string> patch_lines, int fuzziness) {
    MatchOptions options;
    options.fuzziness = fuzziness;
    return patch_code(code_lines, patch_lines, options);
}

bool
fuzzpatch::patch_code(std::vector<std::string>& code_lines,
                      gsl::span<const std::string> patch_lines,
                      const MatchOptions& options) {
    auto hunks = extract_hunks(patch_lines);
    if (hunks.empty()) {
        log_warning("No hunks found in patch");
        return false;
    }
    return apply_hunks(code_lines, hunks, options);
}

#include "unified.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace fuzzpatch;

namespace {

std::string
format_range(const int64_t start, const int64_t count) {
    if (count == 1)
        return fmt::format("{}", start);
    return fmt::format("{},{}", start, count);
}

// Zero based line in the original file where the hunk starts.
int64_t
original_position(const Hunk& hunk) {
    const int64_t start = *hunk.start_original;
    if (hunk.match.empty() && hunk.count_original && *hunk.count_original == 0) {
        return start;
    }
    return std::max<int64_t>(start - 1, 0);
}

// Hunk body: shared head and tail as context, the rest as removals followed
// by additions.
void
render_body(const Hunk& hunk, std::vector<std::string>& out) {
    const auto& a = hunk.match;
    const auto& b = hunk.replace;

    size_t head = 0;
    while (head < a.size() && head < b.size() && a[head] == b[head]) {
        head++;
    }
    size_t tail = 0;
    while (tail < a.size() - head && tail < b.size() - head && a[a.size() - 1 - tail] == b[b.size() - 1 - tail]) {
        tail++;
    }

    for (size_t i = 0; i < head; i++) {
        out.push_back(" " + a[i]);
    }
    for (size_t i = head; i < a.size() - tail; i++) {
        out.push_back("-" + a[i]);
    }
    for (size_t i = head; i < b.size() - tail; i++) {
        out.push_back("+" + b[i]);
    }
    for (size_t i = a.size() - tail; i < a.size(); i++) {
        out.push_back(" " + a[i]);
    }
}

}  // namespace

std::vector<std::string>
fuzzpatch::unified_render(const std::vector<Hunk>& hunks) {
    std::vector<std::string> udiff;

    const Hunk* previous = nullptr;
    int64_t delta = 0;
    for (const auto& hunk : hunks) {
        const bool new_file_header = !previous || previous->filename != hunk.filename ||
                                     previous->is_new_file != hunk.is_new_file ||
                                     previous->is_deleted_file != hunk.is_deleted_file;
        if (new_file_header) {
            delta = 0;
            if (hunk.filename) {
                udiff.push_back(hunk.is_new_file ? "--- /dev/null" : fmt::format("--- a/{}", *hunk.filename));
                udiff.push_back(hunk.is_deleted_file ? "+++ /dev/null" : fmt::format("+++ b/{}", *hunk.filename));
            }
        }
        previous = &hunk;

        if (hunk.match.empty() && hunk.replace.empty()) {
            continue;
        }

        if (!hunk.start_original) {
            udiff.push_back("@@ ... @@");
        } else {
            const int64_t position = original_position(hunk);
            const int64_t new_position = position + delta;
            const int64_t old_start = hunk.match_count() > 0 ? position + 1 : position;
            const int64_t new_start = hunk.replace_count() > 0 ? new_position + 1 : new_position;
            udiff.push_back(fmt::format("@@ -{} +{} @@", format_range(old_start, hunk.match_count()),
                                        format_range(new_start, hunk.replace_count())));
            delta += hunk.replace_count() - hunk.match_count();
        }
        render_body(hunk, udiff);
    }

    return udiff;
}

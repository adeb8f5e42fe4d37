#include "diff_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

using namespace fuzzpatch;

namespace {

const std::regex&
hunk_header_regex() {
    static const std::regex re("^@@ -(\\d+),?(\\d*) \\+(\\d+),?(\\d*) @@");
    return re;
}

std::optional<int64_t>
to_int(const std::ssub_match& m) {
    if (!m.matched || m.length() == 0) {
        return std::nullopt;
    }
    const std::string s = m.str();
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value > kMaxHeaderNumber) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<HunkHeader>
fuzzpatch::parse_hunk_header(const std::string& line) {
    if (line.size() < 2 || line[0] != '@' || line[1] != '@') {
        return std::nullopt;
    }

    std::smatch m;
    if (!std::regex_search(line, m, hunk_header_regex())) {
        return std::nullopt;
    }

    auto start_original = to_int(m[1]);
    auto start_new = to_int(m[3]);
    auto count_original = to_int(m[2]);
    auto count_new = to_int(m[4]);
    if (!start_original || !start_new || (m[2].length() > 0 && !count_original) ||
        (m[4].length() > 0 && !count_new)) {
        // Absurdly large line numbers
        return std::nullopt;
    }

    HunkHeader header;
    header.start_original = *start_original;
    header.count_original = count_original;
    header.start_new = *start_new;
    header.count_new = count_new;
    return header;
}

bool
fuzzpatch::is_placeholder_hunk_header(const std::string& line) {
    if (line.size() < 4 || line.compare(0, 2, "@@") != 0) {
        return false;
    }
    auto close = line.find("@@", 2);
    if (close == std::string::npos) {
        return false;
    }
    return std::none_of(line.begin() + 2, line.begin() + static_cast<long>(close),
                        [](unsigned char c) { return std::isdigit(c); });
}

bool
fuzzpatch::is_unified_diff(gsl::span<const std::string> lines) {
    for (const auto& line : lines) {
        if (line.rfind("@@", 0) != 0) {
            continue;
        }
        if (std::regex_search(line, hunk_header_regex()) || is_placeholder_hunk_header(line)) {
            return true;
        }
    }
    return false;
}

bool
fuzzpatch::is_unified_diff_no_counts(gsl::span<const std::string> lines) {
    for (const auto& line : lines) {
        if (is_placeholder_hunk_header(line)) {
            return true;
        }
    }
    return false;
}

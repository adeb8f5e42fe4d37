#include "hunk_extractor.hpp"

#include "util/log.hpp"

using namespace fuzzpatch;

namespace {

enum class LineKind {
    kOldFile,
    kNewFile,
    kGitHeader,
    kNewFileMode,
    kDeletedFileMode,
    kHunkHeader,
    kOther,
};

bool
starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// "---" and "+++" only count as markers when followed by nothing or
// whitespace, so a removed "----" line stays a body line.
bool
is_marker(const std::string& line, const char* marker) {
    return starts_with(line, marker) && (line.size() == 3 || line[3] == ' ' || line[3] == '\t');
}

LineKind
classify_line(const std::string& line) {
    if (is_marker(line, "---")) {
        return LineKind::kOldFile;
    }
    if (is_marker(line, "+++")) {
        return LineKind::kNewFile;
    }
    if (starts_with(line, "@@")) {
        return LineKind::kHunkHeader;
    }
    if (starts_with(line, "diff --git ")) {
        return LineKind::kGitHeader;
    }
    if (starts_with(line, "new file mode")) {
        return LineKind::kNewFileMode;
    }
    if (starts_with(line, "deleted file mode")) {
        return LineKind::kDeletedFileMode;
    }
    return LineKind::kOther;
}

std::string
trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string
strip_ab_prefix(const std::string& path) {
    if (starts_with(path, "a/") || starts_with(path, "b/")) {
        return path.substr(2);
    }
    return path;
}

// "diff --git a/src/x.py b/src/x.py" -> "src/x.py"
std::optional<std::string>
parse_git_header_path(const std::string& line) {
    auto rest = trim(line.substr(std::string("diff --git ").size()));
    auto pos = rest.rfind(" b/");
    if (pos != std::string::npos) {
        return rest.substr(pos + 3);
    }
    pos = rest.rfind(' ');
    if (pos == std::string::npos || pos + 1 >= rest.size()) {
        return std::nullopt;
    }
    return strip_ab_prefix(rest.substr(pos + 1));
}

// Inside a hunk "--- x" is usually the removed line "-- x" (an SQL or Lua
// comment). It only starts a new file when followed by "+++" and then by a
// hunk header, or, for a new or deleted file without hunks, by the end of
// input.
bool
starts_file_header(gsl::span<const std::string> lines, size_t index) {
    if (index + 1 >= lines.size() || !is_marker(lines[index + 1], "+++")) {
        return false;
    }
    if (index + 2 < lines.size()) {
        return classify_line(lines[index + 2]) == LineKind::kHunkHeader;
    }
    return parse_marker_path(lines[index]).is_null_device || parse_marker_path(lines[index + 1]).is_null_device;
}

enum class PendingHeader {
    kNone,
    kGit,
    kFile,
};

struct Extractor {
    ExtractorState state = ExtractorState::kSeeking;
    std::vector<Hunk> hunks;

    // File the next hunks belong to
    std::optional<std::string> filename;
    bool is_new_file = false;
    bool is_deleted_file = false;

    // A "---" line waiting for its "+++"
    bool old_seen = false;
    MarkerPath old_path;

    // A file header that hasn't produced a hunk yet
    PendingHeader pending = PendingHeader::kNone;

    bool hunk_open = false;
    std::string hunk_header;
    std::vector<std::string> hunk_body;

    void
    close_hunk() {
        if (!hunk_open) {
            return;
        }
        Hunk hunk(hunk_header, hunk_body);
        hunk.filename = filename;
        hunk.is_new_file = is_new_file;
        hunk.is_deleted_file = is_deleted_file;
        hunks.push_back(std::move(hunk));

        hunk_open = false;
        hunk_header.clear();
        hunk_body.clear();
    }

    // New or deleted file without any hunk: emit an empty one so the file is
    // still created or removed.
    void
    flush_pending_header() {
        if (pending != PendingHeader::kNone && filename && (is_new_file || is_deleted_file)) {
            Hunk hunk;
            hunk.filename = filename;
            hunk.is_new_file = is_new_file;
            hunk.is_deleted_file = is_deleted_file;
            hunks.push_back(std::move(hunk));
        }
        pending = PendingHeader::kNone;
    }

    void
    feed(gsl::span<const std::string> lines, size_t index) {
        const std::string& line = lines[index];
        switch (classify_line(line)) {
            case LineKind::kOldFile: {
                if (state == ExtractorState::kInHunk && !starts_file_header(lines, index)) {
                    hunk_body.push_back(line);
                    break;
                }
                close_hunk();
                if (pending == PendingHeader::kFile) {
                    flush_pending_header();
                }
                old_seen = true;
                old_path = parse_marker_path(line);
                state = ExtractorState::kInFileHeader;
            } break;
            case LineKind::kNewFile: {
                // Unpaired "+++ x" in a hunk is the added line "++ x"
                if (state == ExtractorState::kInHunk) {
                    hunk_body.push_back(line);
                    break;
                }
                close_hunk();
                auto new_path = parse_marker_path(line);
                const bool from_null = old_seen && old_path.is_null_device;
                if (new_path.is_null_device) {
                    filename = old_seen ? old_path.path : filename;
                    is_new_file = false;
                    is_deleted_file = true;
                } else {
                    if (new_path.path) {
                        filename = new_path.path;
                    } else if (old_seen && old_path.path) {
                        filename = old_path.path;
                    }
                    is_new_file = from_null;
                    is_deleted_file = false;
                }
                old_seen = false;
                pending = PendingHeader::kFile;
                state = ExtractorState::kInFileHeader;
            } break;
            case LineKind::kGitHeader: {
                close_hunk();
                flush_pending_header();
                filename = parse_git_header_path(line);
                is_new_file = false;
                is_deleted_file = false;
                old_seen = false;
                pending = PendingHeader::kGit;
                state = ExtractorState::kSeeking;
            } break;
            case LineKind::kNewFileMode:
            case LineKind::kDeletedFileMode: {
                if (state == ExtractorState::kInHunk) {
                    hunk_body.push_back(line);
                } else if (pending == PendingHeader::kGit) {
                    const bool is_new = classify_line(line) == LineKind::kNewFileMode;
                    is_new_file = is_new;
                    is_deleted_file = !is_new;
                }
            } break;
            case LineKind::kHunkHeader: {
                close_hunk();
                if (old_seen) {
                    // "---" with no "+++"
                    if (old_path.path && !old_path.is_null_device) {
                        filename = old_path.path;
                        is_new_file = false;
                        is_deleted_file = false;
                    }
                    old_seen = false;
                }
                pending = PendingHeader::kNone;
                hunk_open = true;
                hunk_header = line;
                state = ExtractorState::kInHunk;
            } break;
            case LineKind::kOther: {
                if (state == ExtractorState::kInHunk) {
                    hunk_body.push_back(line);
                }
            } break;
        }
    }

    void
    finish() {
        close_hunk();
        flush_pending_header();
    }
};

}  // namespace

std::string
fuzzpatch::to_string(ExtractorState state) {
    switch (state) {
        case ExtractorState::kSeeking:
            return "seeking";
        case ExtractorState::kInFileHeader:
            return "in file header";
        case ExtractorState::kInHunk:
            return "in hunk";
    }
    return "unknown";
}

MarkerPath
fuzzpatch::parse_marker_path(const std::string& line) {
    MarkerPath result;
    if (line.size() <= 3) {
        return result;
    }

    auto rest = line.substr(3);
    auto tab = rest.find('\t', 1);
    if (tab != std::string::npos) {
        rest.erase(tab);
    }
    rest = trim(rest);
    if (rest.empty()) {
        return result;
    }

    if (rest == "/dev/null" || rest == "nul" || rest == "NUL") {
        result.is_null_device = true;
        return result;
    }

    rest = strip_ab_prefix(rest);
    if (!rest.empty()) {
        result.path = rest;
    }
    return result;
}

std::vector<Hunk>
fuzzpatch::extract_hunks(gsl::span<const std::string> lines) {
    Extractor extractor;
    for (size_t i = 0; i < lines.size(); i++) {
        const ExtractorState before = extractor.state;
        extractor.feed(lines, i);
        if (extractor.state != before) {
            log_debug("Line {}: {} -> {}", i + 1, to_string(before), to_string(extractor.state));
        }
    }
    extractor.finish();

    log_debug("Extracted {} hunks", extractor.hunks.size());
    for (const auto& hunk : extractor.hunks) {
        log_debug("  {}", repr(hunk));
    }
    return std::move(extractor.hunks);
}

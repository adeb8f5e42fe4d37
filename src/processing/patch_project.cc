#include "patch_project.hpp"

#include "config/ordered_map.hpp"
#include "processing/hunk_extractor.hpp"
#include "processing/patch_code.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <algorithm>

using namespace fuzzpatch;

namespace fs = std::filesystem;

namespace {

fs::path
normalized_root(const fs::path& project_root, std::error_code& ec) {
    auto absolute = fs::absolute(project_root, ec);
    if (ec) {
        return {};
    }
    auto root = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return {};
    }
    root = root.lexically_normal();
    if (!root.has_filename() && root.has_parent_path() && root != root.root_path()) {
        root = root.parent_path();
    }
    return root;
}

PatchFileStatus
patch_file(const fs::path& project_root,
           const std::string& filename,
           const std::vector<Hunk>& hunks,
           const ProjectPatchOptions& options,
           FilePatchResult& result) {
    if (!resolve_project_path(project_root, filename, result.path)) {
        log_error("Refusing to patch '{}': outside of project root '{}'", filename, project_root.string());
        return PatchFileStatus::kOutsideProjectRoot;
    }

    const bool new_file = std::all_of(hunks.begin(), hunks.end(), [](const Hunk& h) { return h.is_new_file; });
    const bool deleted_file =
        std::all_of(hunks.begin(), hunks.end(), [](const Hunk& h) { return h.is_deleted_file; });

    std::error_code ec;
    TextFile file;
    if (new_file) {
        if (fs::exists(result.path, ec)) {
            log_warning("New file '{}' already exists, its content is replaced", filename);
        }
    } else {
        if (!fs::is_regular_file(result.path, ec)) {
            log_error("Can't patch '{}': file does not exist", filename);
            return PatchFileStatus::kFileDoesNotExist;
        }
        if (!read_text_file(result.path.string(), file)) {
            log_error("Can't patch '{}': failed to read file", filename);
            return PatchFileStatus::kReadFailed;
        }
    }

    if (!apply_hunks(file.lines, hunks, options.match)) {
        log_error("Can't patch '{}': hunk not found", filename);
        return PatchFileStatus::kHunkNotFound;
    }

    if (options.dry_run) {
        log_info("Would patch '{}' ({} hunks)", filename, hunks.size());
        return PatchFileStatus::kOk;
    }

    if (deleted_file) {
        if (!file.lines.empty()) {
            log_warning("Removing '{}' although {} lines were left after patching", filename, file.lines.size());
        }
        if (!fs::remove(result.path, ec) || ec) {
            log_error("Can't remove '{}': {}", filename, ec ? ec.message() : "file does not exist");
            return PatchFileStatus::kWriteFailed;
        }
        result.removed = true;
        log_info("Removed '{}'", filename);
        return PatchFileStatus::kOk;
    }

    if (new_file) {
        fs::create_directories(result.path.parent_path(), ec);
        if (ec) {
            log_error("Can't create directory for '{}': {}", filename, ec.message());
            return PatchFileStatus::kWriteFailed;
        }
        result.created = true;
    }

    if (!write_text_file(result.path.string(), file)) {
        log_error("Can't patch '{}': failed to write file", filename);
        result.created = false;
        return PatchFileStatus::kWriteFailed;
    }

    log_info("Patched '{}' ({} hunks)", filename, hunks.size());
    return PatchFileStatus::kOk;
}

}  // namespace

std::string
fuzzpatch::to_string(PatchFileStatus status) {
    switch (status) {
        case PatchFileStatus::kOk:
            return "ok";
        case PatchFileStatus::kOutsideProjectRoot:
            return "outside project root";
        case PatchFileStatus::kFileDoesNotExist:
            return "file does not exist";
        case PatchFileStatus::kReadFailed:
            return "read failed";
        case PatchFileStatus::kHunkNotFound:
            return "hunk not found";
        case PatchFileStatus::kWriteFailed:
            return "write failed";
    }
    return "unknown";
}

bool
ProjectPatchReport::ok() const {
    return std::all_of(files.begin(), files.end(),
                       [](const FilePatchResult& f) { return f.status == PatchFileStatus::kOk; });
}

bool
fuzzpatch::resolve_project_path(const fs::path& project_root, const std::string& filename, fs::path& resolved) {
    if (filename.empty()) {
        return false;
    }

    std::error_code ec;
    const auto root = normalized_root(project_root, ec);
    if (ec || root.empty()) {
        return false;
    }

    auto target = fs::weakly_canonical(root / fs::path(filename), ec);
    if (ec) {
        return false;
    }
    target = target.lexically_normal();

    const auto relative = target.lexically_relative(root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return false;
    }

    resolved = target;
    return true;
}

bool
fuzzpatch::patch_project(const fs::path& project_root, gsl::span<const std::string> patch_lines, int fuzziness) {
    ProjectPatchOptions options;
    options.match.fuzziness = fuzziness;
    return patch_project(project_root, patch_lines, options);
}

bool
fuzzpatch::patch_project(const fs::path& project_root,
                         gsl::span<const std::string> patch_lines,
                         const ProjectPatchOptions& options,
                         ProjectPatchReport* report) {
    auto hunks = extract_hunks(patch_lines);

    OrderedMap<std::string, std::vector<Hunk>> groups;
    int64_t skipped = 0;
    for (auto& hunk : hunks) {
        if (!hunk.filename) {
            skipped++;
            continue;
        }
        groups[*hunk.filename].push_back(std::move(hunk));
    }

    if (skipped > 0) {
        log_warning("Skipping {} hunks without a filename", skipped);
    }
    if (report) {
        report->skipped_hunks = skipped;
    }
    if (groups.size() == 0) {
        log_warning("Patch doesn't name any file");
    }

    bool ok = true;
    groups.for_each([&](const std::string& filename, std::vector<Hunk>& file_hunks) {
        FilePatchResult result;
        result.filename = filename;
        result.hunk_count = static_cast<int64_t>(file_hunks.size());
        result.status = patch_file(project_root, filename, file_hunks, options, result);
        if (result.status != PatchFileStatus::kOk) {
            ok = false;
        }
        if (report) {
            report->files.push_back(std::move(result));
        }
    });

    return ok;
}

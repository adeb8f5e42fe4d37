#pragma once

/*
    Apply a multi-file diff to a directory tree.

    Hunks are grouped by target file and each file is patched on its own:
    a file that fails to patch is left as it was and doesn't stop the others.
    Nothing outside the project root is ever read or written.
*/

#include "processing/line_matcher.hpp"

#include <gsl/span>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fuzzpatch {

enum class PatchFileStatus {
    kOk,
    kOutsideProjectRoot,
    kFileDoesNotExist,
    kReadFailed,
    kHunkNotFound,
    kWriteFailed,
};

std::string
to_string(PatchFileStatus status);

struct ProjectPatchOptions {
    MatchOptions match;

    // Do everything except touching the files.
    bool dry_run = false;
};

struct FilePatchResult {
    std::string filename;
    std::filesystem::path path;
    PatchFileStatus status = PatchFileStatus::kOk;
    int64_t hunk_count = 0;
    bool created = false;
    bool removed = false;
};

struct ProjectPatchReport {
    std::vector<FilePatchResult> files;

    // Hunks that didn't name a file
    int64_t skipped_hunks = 0;

    bool
    ok() const;
};

// Resolve `filename` below `project_root`. Fails when the result, with
// symlinks and ".." resolved, isn't strictly inside the root.
bool
resolve_project_path(const std::filesystem::path& project_root,
                     const std::string& filename,
                     std::filesystem::path& resolved);

bool
patch_project(const std::filesystem::path& project_root, gsl::span<const std::string> patch_lines, int fuzziness);

bool
patch_project(const std::filesystem::path& project_root,
              gsl::span<const std::string> patch_lines,
              const ProjectPatchOptions& options,
              ProjectPatchReport* report = nullptr);

}  // namespace fuzzpatch

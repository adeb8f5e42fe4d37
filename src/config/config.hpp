#pragma once

#include "config/config_parser.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fuzzpatch {

enum class InputMode {
    kProject,     // patch every file named in the diff, relative to a root
    kSingleFile,  // patch one known file, ignoring file markers
};

struct ProgramOptions {
    bool help = false;
    bool classify = false;
    bool normalize = false;
    bool markdown = false;
    bool dry_run = false;

    InputMode mode = InputMode::kProject;
    int64_t fuzziness = 1;
    std::vector<std::string> comment_markers = {"#"};

    std::string log_level = "info";
    bool color = true;
    std::string debug_color = "dark_gray";
    std::string info_color = "cyan";
    std::string warning_color = "yellow";
    std::string error_color = "light_red";

    std::string project_root = ".";
    std::string target_file;

    // "-" reads the patch from stdin
    std::string patch_path;
};

// $FUZZPATCH_CONFIG_DIR when set, otherwise <config home>/fuzzpatch
std::string
config_get_directory();

// Load fuzzpatch.conf from the config directory into `program_options`.
// Settings missing from the file keep their defaults; a missing file is
// created with the defaults.
void
config_apply_options(ProgramOptions& program_options);

// Same as above for an explicit file. Returns false if the file exists but
// couldn't be parsed; the options are left at their defaults in that case.
bool
config_apply_options(const std::string& config_path, ProgramOptions& program_options, bool write_defaults);

// Push the logging related options to the logger.
void
config_apply_logging(const ProgramOptions& program_options);

}  // namespace fuzzpatch

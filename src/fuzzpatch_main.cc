#include "config/config.hpp"
#include "output/unified.hpp"
#include "processing/code_blocks.hpp"
#include "processing/diff_classifier.hpp"
#include "processing/hunk_extractor.hpp"
#include "processing/patch_code.hpp"
#include "processing/patch_project.hpp"
#include "util/color.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"
#include "util/tty.hpp"

#include <getopt.h>
#include <unistd.h>

#include <fmt/format.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace fuzzpatch {

enum ExitCode {
    kExitOk = 0,
    kExitPatchFailed = 1,
    kExitUsage = 2,
};

bool
read_patch_input(const std::string& path, std::vector<std::string>& lines) {
    TextFile input;
    if (path == "-") {
        if (!read_text_stream(stdin, input)) {
            log_error("failed to read patch from stdin");
            return false;
        }
    } else if (!read_text_file(path, input)) {
        log_error("failed to read patch file '{}'", path);
        return false;
    }
    lines = std::move(input.lines);
    return true;
}

// Pick the diff out of a markdown formatted model response: a block tagged
// "diff" or "patch", else the first block that looks like a diff.
bool
select_diff_block(const std::vector<std::string>& response, std::vector<std::string>& lines) {
    auto blocks = extract_code_blocks(response);
    for (const char* language : {"diff", "patch"}) {
        if (const CodeBlock* block = find_code_block(blocks, language)) {
            lines = block->lines;
            return true;
        }
    }
    for (const auto& block : blocks) {
        if (is_unified_diff(block.lines)) {
            lines = block.lines;
            return true;
        }
    }
    return false;
}

std::string
colorize(const std::string& text, const TermColor& color, bool enabled) {
    if (!enabled) {
        return text;
    }
    return color.to_ansi() + text + TermColor::kReset.to_ansi();
}

int
run_single_file(const ProgramOptions& opts, const std::vector<std::string>& patch_lines) {
    TextFile file;
    if (!read_text_file(opts.target_file, file)) {
        log_error("can't read '{}'", opts.target_file);
        return kExitPatchFailed;
    }

    MatchOptions match;
    match.fuzziness = static_cast<int>(opts.fuzziness);
    match.comment_markers = opts.comment_markers;

    if (!patch_code(file.lines, patch_lines, match)) {
        log_error("failed to patch '{}'", opts.target_file);
        return kExitPatchFailed;
    }

    if (opts.dry_run) {
        log_info("patch applies to '{}'", opts.target_file);
        return kExitOk;
    }

    if (!write_text_file(opts.target_file, file)) {
        log_error("can't write '{}'", opts.target_file);
        return kExitPatchFailed;
    }
    return kExitOk;
}

// A response without a diff carries the whole new file in its first code
// block.
int
run_replace_file(const ProgramOptions& opts, const std::vector<std::string>& response) {
    auto blocks = extract_code_blocks(response);
    if (blocks.empty()) {
        log_error("no code block in the response");
        return kExitUsage;
    }

    // Keep the line ending style of the file being replaced
    TextFile file;
    if (!read_text_file(opts.target_file, file)) {
        log_debug("'{}' doesn't exist yet", opts.target_file);
    }
    file.lines = code_block_file_lines(blocks.front());
    file.final_newline = true;

    if (opts.dry_run) {
        log_info("would replace '{}' with {} lines", opts.target_file, file.lines.size());
        return kExitOk;
    }

    if (!write_text_file(opts.target_file, file)) {
        log_error("can't write '{}'", opts.target_file);
        return kExitPatchFailed;
    }
    log_info("replaced '{}' ({} lines)", opts.target_file, file.lines.size());
    return kExitOk;
}

int
run_project(const ProgramOptions& opts, const std::vector<std::string>& patch_lines, bool color) {
    ProjectPatchOptions options;
    options.match.fuzziness = static_cast<int>(opts.fuzziness);
    options.match.comment_markers = opts.comment_markers;
    options.dry_run = opts.dry_run;

    ProjectPatchReport report;
    bool ok = patch_project(opts.project_root, patch_lines, options, &report);

    for (const auto& file : report.files) {
        const bool file_ok = file.status == PatchFileStatus::kOk;
        std::string status = file_ok ? (file.removed ? "removed" : file.created ? "created" : "patched")
                                     : to_string(file.status);
        if (file_ok && opts.dry_run) {
            status = "would apply";
        }
        fmt::print("{}  {}\n",
                   colorize(fmt::format("{:>20}", status), file_ok ? TermColor::kGreen : TermColor::kRed, color),
                   file.filename);
    }
    if (report.skipped_hunks > 0) {
        fmt::print("{}  {} hunks without a file name\n",
                   colorize(fmt::format("{:>20}", "skipped"), TermColor::kYellow, color), report.skipped_hunks);
    }

    return ok ? kExitOk : kExitPatchFailed;
}

}  // namespace fuzzpatch

int
main(int argc, char* argv[]) {
    fuzzpatch::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] [patch_file | -]

Apply a unified diff, as written by a language model, with tolerance for
wrong line numbers, missing context markers and mangled context lines.

Options:
    -p, --project [dir]      apply to the files named in the diff, below dir (default: .)
    -f, --file [path]        apply the whole diff to one file, ignoring file names in the diff
    -z, --fuzziness [n]      highest matching tolerance
                                 0 exact lines
                                 1 ignore trailing whitespace and comments
                                 2 also ignore indentation
    -m, --markdown           input is a markdown response; use the diff code block,
                             or with -f, replace the file with the first code block
                             when the response has no diff
    -n, --dry-run            check that the patch applies without writing anything
    -c, --classify           report whether the input is a unified diff and exit
    -N, --normalize          print the diff with corrected hunk headers and exit

    -q, --quiet              only report errors
    -d, --debug              verbose diagnostics
    -v, --version            show program version and exit
    -h, --help               show this help

The patch is read from stdin when no file is given.
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + fuzzpatch::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"project", required_argument, 0, 'p'},
                                               {"file", required_argument, 0, 'f'},
                                               {"fuzziness", required_argument, 0, 'z'},
                                               {"markdown", no_argument, 0, 'm'},
                                               {"dry-run", no_argument, 0, 'n'},
                                               {"classify", no_argument, 0, 'c'},
                                               {"normalize", no_argument, 0, 'N'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"debug", no_argument, 0, 'd'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvp:f:z:mncNqd", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", FUZZPATCH_VERSION);
                    fmt::print("vcs hash: {}\n", FUZZPATCH_BUILD_HASH);
                    exit(fuzzpatch::kExitOk);
                case 'h':
                    opts.help = true;
                    return true;
                case 'p':
                    opts.mode = fuzzpatch::InputMode::kProject;
                    opts.project_root = optarg;
                    break;
                case 'f':
                    opts.mode = fuzzpatch::InputMode::kSingleFile;
                    opts.target_file = optarg;
                    break;
                case 'z': {
                    if (!isdigit(static_cast<unsigned char>(optarg[0]))) {
                        show_help(fmt::format("error: invalid value for -z ({})\n", optarg));
                        return false;
                    }
                    opts.fuzziness = atoi(optarg);
                    if (opts.fuzziness > fuzzpatch::kMaxFuzziness) {
                        fuzzpatch::log_warning("fuzziness {} is above the maximum, using {}", opts.fuzziness,
                                               fuzzpatch::kMaxFuzziness);
                        opts.fuzziness = fuzzpatch::kMaxFuzziness;
                    }
                    break;
                }
                case 'm':
                    opts.markdown = true;
                    break;
                case 'n':
                    opts.dry_run = true;
                    break;
                case 'c':
                    opts.classify = true;
                    break;
                case 'N':
                    opts.normalize = true;
                    break;
                case 'q':
                    opts.log_level = "error";
                    break;
                case 'd':
                    opts.log_level = "debug";
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (opts.classify && opts.normalize) {
            show_help("error: -c and -N are mutually exclusive");
            return false;
        }

        int positional_count = in_argc - optind;
        if (positional_count > 1) {
            show_help("error: too many positional arguments");
            return false;
        }

        if (positional_count == 1) {
            opts.patch_path = in_argv[optind];
        } else if (!fuzzpatch::tty_is_terminal(STDIN_FILENO)) {
            opts.patch_path = "-";
        } else {
            show_help("error: missing patch file");
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    fuzzpatch::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return fuzzpatch::kExitUsage;
    }

    if (opts.help) {
        show_help("");
        return fuzzpatch::kExitOk;
    }

    fuzzpatch::config_apply_logging(opts);

    std::vector<std::string> patch_lines;
    if (!fuzzpatch::read_patch_input(opts.patch_path, patch_lines)) {
        return fuzzpatch::kExitUsage;
    }

    if (opts.markdown) {
        std::vector<std::string> response = std::move(patch_lines);
        if (!fuzzpatch::select_diff_block(response, patch_lines)) {
            if (opts.mode == fuzzpatch::InputMode::kSingleFile && !opts.classify && !opts.normalize) {
                return fuzzpatch::run_replace_file(opts, response);
            }
            fuzzpatch::log_error("no diff code block in the response");
            return fuzzpatch::kExitUsage;
        }
    }

    if (opts.classify) {
        const bool unified = fuzzpatch::is_unified_diff(patch_lines);
        const bool no_counts = fuzzpatch::is_unified_diff_no_counts(patch_lines);
        fmt::print("unified diff: {}\n", unified ? "yes" : "no");
        fmt::print("placeholder headers: {}\n", no_counts ? "yes" : "no");
        fmt::print("hunks: {}\n", fuzzpatch::extract_hunks(patch_lines).size());
        return unified ? fuzzpatch::kExitOk : fuzzpatch::kExitPatchFailed;
    }

    if (!fuzzpatch::is_unified_diff(patch_lines)) {
        fuzzpatch::log_error("input is not a unified diff");
        return fuzzpatch::kExitUsage;
    }

    if (opts.normalize) {
        for (const auto& line : fuzzpatch::unified_render(fuzzpatch::extract_hunks(patch_lines))) {
            fmt::print("{}\n", line);
        }
        return fuzzpatch::kExitOk;
    }

    switch (opts.mode) {
        case fuzzpatch::InputMode::kSingleFile:
            return fuzzpatch::run_single_file(opts, patch_lines);
        case fuzzpatch::InputMode::kProject: {
            const bool color = opts.color && fuzzpatch::tty_get_capabilities(STDOUT_FILENO) !=
                                                 fuzzpatch::TermColorSupport_None;
            return fuzzpatch::run_project(opts, patch_lines, color);
        }
    }
    return fuzzpatch::kExitUsage;
}

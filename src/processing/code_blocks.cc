#include "code_blocks.hpp"

#include "util/log.hpp"

#include <optional>

using namespace fuzzpatch;

namespace {

const char* const kWhitespace = " \t\r";

std::string
trim(const std::string& s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

std::string
right_trim(const std::string& s) {
    auto end = s.find_last_not_of(kWhitespace);
    return (end == std::string::npos) ? std::string() : s.substr(0, end + 1);
}

struct Fence {
    std::string marker;
    std::string language;
};

// "```python" -> {"```", "python"}
std::optional<Fence>
parse_fence(const std::string& line) {
    const auto text = trim(line);
    if (text.empty() || (text[0] != '`' && text[0] != '~')) {
        return std::nullopt;
    }

    size_t n = 0;
    while (n < text.size() && text[n] == text[0]) {
        n++;
    }
    if (n < 3 || n > 4) {
        return std::nullopt;
    }

    Fence fence;
    fence.marker = text.substr(0, n);
    fence.language = trim(text.substr(n));
    if (fence.language.find_first_of(" \t`~") != std::string::npos) {
        return std::nullopt;
    }
    return fence;
}

bool
is_fence_line(const std::string& line) {
    return parse_fence(line).has_value();
}

}  // namespace

std::vector<CodeBlock>
fuzzpatch::extract_code_blocks(gsl::span<const std::string> lines) {
    std::vector<CodeBlock> blocks;

    std::optional<Fence> open;
    CodeBlock current;
    for (const auto& line : lines) {
        if (!open) {
            open = parse_fence(line);
            if (open) {
                current.language = open->language.empty() ? "plaintext" : open->language;
                current.lines.clear();
            }
            continue;
        }

        if (trim(line) == open->marker) {
            blocks.push_back(std::move(current));
            current = CodeBlock();
            open.reset();
            continue;
        }
        current.lines.push_back(line);
    }

    if (open) {
        log_debug("Ignoring unterminated {} block", current.language);
    }
    return blocks;
}

const CodeBlock*
fuzzpatch::find_code_block(const std::vector<CodeBlock>& blocks, const std::string& language) {
    for (const auto& block : blocks) {
        if (block.language == language) {
            return &block;
        }
    }
    return nullptr;
}

std::vector<std::string>
fuzzpatch::clean_code_block(gsl::span<const std::string> lines) {
    size_t first = 0;
    size_t last = lines.size();
    if (last > first && is_fence_line(lines[first])) {
        first++;
    }
    if (last > first) {
        auto fence = parse_fence(lines[last - 1]);
        if (fence && fence->language.empty()) {
            last--;
        }
    }

    std::vector<std::string> result;
    int empty_run = 0;
    for (size_t i = first; i < last; i++) {
        if (lines[i].empty()) {
            if (++empty_run > 2) {
                continue;
            }
        } else {
            empty_run = 0;
        }
        result.push_back(lines[i]);
    }
    return result;
}

std::vector<std::string>
fuzzpatch::normalize_output(gsl::span<const std::string> lines) {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        result.push_back(right_trim(line));
    }

    size_t leading = 0;
    while (leading < result.size() && result[leading].empty()) {
        leading++;
    }
    result.erase(result.begin(), result.begin() + static_cast<long>(leading));

    while (!result.empty() && result.back().empty()) {
        result.pop_back();
    }
    return result;
}

std::vector<std::string>
fuzzpatch::code_block_file_lines(const CodeBlock& block) {
    return normalize_output(clean_code_block(block.lines));
}

#pragma once

/*
    Helpers for pulling code out of model responses.

    Responses are markdown; the code (or diff) sits in fenced blocks opened
    with ```, ````, ~~~ or ~~~~ and an optional language tag, and closed by
    the same fence.
*/

#include <gsl/span>

#include <string>
#include <vector>

namespace fuzzpatch {

struct CodeBlock {
    std::string language;  // "plaintext" when the fence has no tag
    std::vector<std::string> lines;
};

// Fenced blocks in the order they appear. Unterminated blocks are dropped.
std::vector<CodeBlock>
extract_code_blocks(gsl::span<const std::string> lines);

// First block tagged `language`, or nullptr.
const CodeBlock*
find_code_block(const std::vector<CodeBlock>& blocks, const std::string& language);

// Remove a leading fence line and a trailing fence, and squeeze runs of more
// than two empty lines.
std::vector<std::string>
clean_code_block(gsl::span<const std::string> lines);

// Right-trim every line and drop empty lines at both ends.
std::vector<std::string>
normalize_output(gsl::span<const std::string> lines);

// Contents of a block that holds a complete file: cleaned and normalized,
// ready to replace the file.
std::vector<std::string>
code_block_file_lines(const CodeBlock& block);

}  // namespace fuzzpatch

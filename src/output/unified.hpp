#pragma once

#include "processing/diff_hunk.hpp"

#include <string>
#include <vector>

namespace fuzzpatch {

// Render parsed hunks back into a well formed unified diff, with file headers
// and hunk headers whose counts agree with the hunk bodies. Line numbers come
// from the declared start lines; hunks without one get a "@@ ... @@" header.
std::vector<std::string>
unified_render(const std::vector<Hunk>& hunks);

}  // namespace fuzzpatch

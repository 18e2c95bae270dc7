#pragma once
#include <cstddef>
#include <string_view>

namespace code_atlas {

// Rough BPE-style estimate. Identifier runs cost one token per 4 chars,
// every other visible byte costs one, each run of newlines costs one.
std::size_t estimate_tokens(std::string_view text);

} // namespace code_atlas

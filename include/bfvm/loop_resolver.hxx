#pragma once

#include <cstddef>
#include <limits>
#include <string_view>
#include <vector>

#include "bfvm/error.hxx"

namespace bfvm {

inline constexpr size_t kNoJump = std::numeric_limits<size_t>::max();

// One slot per source position: the partner bracket's position, or kNoJump.
using JumpTable = std::vector<size_t>;

/// @brief Pairs every `[` with its `]` in a single scan.
/// @param code Program text; non-instruction characters keep their positions.
/// @param table Output, resized to code.size(). Left unspecified on failure.
/// @return ok(), or UnbalancedBrackets at the stray `]` / first unclosed `[`.
Status resolveLoops(std::string_view code, JumpTable& table);
}  // namespace bfvm

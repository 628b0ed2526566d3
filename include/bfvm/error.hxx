/*
    Bfvm - A minimal brainfuck VM
    Structured execution results
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace bfvm {

enum class ErrorKind : uint8_t {
    None,
    UnbalancedBrackets,
    PointerUnderflow,
    OutputFailure,
    InputFailure,
};

/// @brief Result of resolving or running a program.
/// For UnbalancedBrackets the character at `position` is the offending bracket: a stray `]`, or
/// the first `[` left open at end of input. For the other kinds it is the instruction pointer at
/// the time of failure. `cause` is set for the I/O kinds only.
struct Status {
    ErrorKind kind = ErrorKind::None;
    size_t position = 0;
    std::error_code cause{};

    bool ok() const { return kind == ErrorKind::None; }
};

struct SourceLocation {
    size_t line = 1;
    size_t column = 1;
};

// 1-based line/column of `pos` in `code`. Positions past the end map just after the last char.
SourceLocation locate(std::string_view code, size_t pos);

// One-line message, e.g. "Unmatched close bracket at 3:7".
std::string describe(const Status& status, std::string_view code);

}  // namespace bfvm

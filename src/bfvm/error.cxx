/*
    Bfvm - A minimal brainfuck VM
    Human-readable status messages
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfvm/error.hxx"

#include <algorithm>
#include <string>
#include <string_view>

namespace bfvm {

SourceLocation locate(std::string_view code, size_t pos) {
    SourceLocation loc;
    const size_t end = std::min(pos, code.length());
    for (size_t i = 0; i < end; ++i) {
        if (code[i] == '\n') {
            ++loc.line;
            loc.column = 1;
        } else {
            ++loc.column;
        }
    }
    return loc;
}

std::string describe(const Status& status, std::string_view code) {
    std::string msg;
    switch (status.kind) {
        case ErrorKind::None:
            return "OK";
        case ErrorKind::UnbalancedBrackets:
            msg = status.position < code.length() && code[status.position] == '['
                      ? "Unmatched open bracket"
                      : "Unmatched close bracket";
            break;
        case ErrorKind::PointerUnderflow:
            msg = "Cell pointer moved before start";
            break;
        case ErrorKind::OutputFailure:
            msg = "Output failed";
            break;
        case ErrorKind::InputFailure:
            msg = "Input failed";
            break;
    }
    const SourceLocation loc = locate(code, status.position);
    msg += " at " + std::to_string(loc.line) + ':' + std::to_string(loc.column);
    if (status.cause) msg += " (" + status.cause.message() + ')';
    return msg;
}

}  // namespace bfvm

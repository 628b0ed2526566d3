/*
    Bfvm - A minimal brainfuck VM
    REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef BFVM_ENABLE_REPL
#include <string>
#include <vector>

#include "bfvm.hxx"

namespace bfvm {

struct ReplConfig {
    bool highlightChanges = false;
};

// What the session loop should do with one line of user input.
enum class LineAction { Run, Continue, Command, Exit };

/// @brief Accumulates input lines until the pending program has no unclosed `[`.
/// @param pending Buffer carried between calls; cleared once the program is handed out.
/// @param line New line from the user (without trailing newline).
/// @param program Set to the complete program when the result is Run.
/// @return Exit for any line containing `exit`, even inside an open loop (pending is dropped).
/// Command for `:` lines (only when nothing is pending),
/// Continue while an open bracket is waiting for its match, Run otherwise.
LineAction feedLine(std::string& pending, const std::string& line, std::string& program);

// Interactive session on stdin/stdout. Returns the process exit code.
int runRepl(ReplConfig& cfg);

}  // namespace bfvm
#endif  // BFVM_ENABLE_REPL

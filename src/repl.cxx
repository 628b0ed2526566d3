/*
    Bfvm - A minimal brainfuck VM
    Simple line-based REPL implementation using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef BFVM_ENABLE_REPL
#include "repl.hxx"

#include <linenoise.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "bfvm/ansi.hxx"
#include "bfvm/dump.hxx"

namespace bfvm {

LineAction feedLine(std::string& pending, const std::string& line, std::string& program) {
    if (line.find("exit") != std::string::npos) {
        pending.clear();
        return LineAction::Exit;
    }
    if (pending.empty() && !line.empty() && line[0] == ':') return LineAction::Command;
    pending += line;
    pending += '\n';
    JumpTable jumps;
    const Status status = resolveLoops(pending, jumps);
    if (status.kind == ErrorKind::UnbalancedBrackets && pending[status.position] == '[') {
        return LineAction::Continue;
    }
    // Balanced, or a stray `]` that the executor will report.
    program.swap(pending);
    pending.clear();
    return LineAction::Run;
}

int runRepl(ReplConfig& cfg) {
    linenoiseHistorySetMaxLen(BFVM_REPL_HISTORY);
    FdSource in(STDIN_FILENO);
    FdSink out(STDOUT_FILENO);
    Executor executor(in, out);
    std::vector<uint8_t> prevCells;
    std::vector<size_t> changed;
    std::string pending;
    std::string program;
    std::cout << "Write exit to finish the interpreter" << std::endl;
    while (true) {
        char* line = linenoise(pending.empty() ? "> " : "==> ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        const LineAction action = feedLine(pending, input, program);
        if (action == LineAction::Exit) break;
        if (action == LineAction::Continue) continue;
        if (action == LineAction::Command) {
            std::istringstream iss(input.substr(1));
            std::string cmd;
            iss >> cmd;
            if (cmd == "q" || cmd == "quit") {
                break;
            } else if (cmd == "dump") {
                dumpMemory(executor.cells(), executor.cellPtr(), std::cout, &changed,
                           cfg.highlightChanges);
            } else if (cmd == "help") {
                std::cout << "Commands:\n"
                          << ":dump              show memory\n"
                          << ":highlight on|off  highlight changed cells\n"
                          << ":reset             clear memory and pointer\n"
                          << ":q                 quit\n"
                          << "exit               quit" << std::endl;
            } else if (cmd == "highlight") {
                std::string val;
                iss >> val;
                if (val == "on") {
                    cfg.highlightChanges = true;
                } else if (val == "off") {
                    cfg.highlightChanges = false;
                    changed.clear();
                } else {
                    std::cout << "Expected on or off" << std::endl;
                }
            } else if (cmd == "reset") {
                executor.reset();
                changed.clear();
            } else {
                std::cout << "Unknown command" << std::endl;
            }
            continue;
        }
        if (cfg.highlightChanges) prevCells = executor.cells();
        const Status status = executor.execute(program);
        if (!status.ok()) {
            std::cout << ansi::red << "ERROR:" << ansi::reset << ' ' << describe(status, program)
                      << std::endl;
        }
        if (cfg.highlightChanges) changed = changedCells(prevCells, executor.cells());
        program.clear();
    }
    return 0;
}

}  // namespace bfvm
#endif  // BFVM_ENABLE_REPL

/*
    Bfvm - A minimal brainfuck VM
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <unistd.h>

#include <iostream>
#include <string>
#include <string_view>

#include "bfvm.hxx"
#include "bfvm/dump.hxx"
#include "bfvm/source_file.hxx"
#ifdef BFVM_ENABLE_REPL
#include "cpp-terminal/color.hpp"
#include "repl.hxx"
#endif

namespace {
struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool interactive = false;
    bool dumpMemory = false;
    bool profile = false;
    bool help = false;
    bool bad = false;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e") {
            if (i + 1 >= argc) {
                args.bad = true;
                break;
            }
            args.evalCode = argv[++i];
            args.hasEval = true;
        } else if (arg == "-i") {
            args.interactive = true;
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.bad = true;
        } else {
            args.filename = argv[i];
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [file]\n"
              << "Options:\n"
              << "  <file>           Execute code from file (takes precedence over -e)\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i               Interactive interpreter\n"
              << "  -dm              Dump memory after program\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void printError(const std::string& msg) {
#ifdef BFVM_ENABLE_REPL
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg << std::endl;
#else
    std::cerr << "ERROR: " << msg << std::endl;
#endif
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.bad) {
        printHelp(argv[0]);
        return 1;
    }
    if (opts.interactive && !opts.hasEval && opts.filename.empty()) {
#ifdef BFVM_ENABLE_REPL
        bfvm::ReplConfig cfg;
        return bfvm::runRepl(cfg);
#else
        printError("REPL disabled; pass a file or -e <code> to run a program");
        return 1;
#endif
    }
    std::string code;
    if (!opts.filename.empty()) {
        std::string err;
        if (!bfvm::readSourceFile(opts.filename, code, err)) {
            printError("Cannot read the script: " + err);
            return 1;
        }
    } else if (opts.hasEval) {
        code = opts.evalCode;
    } else {
        printError("No file provided and not running in interpreted mode or eval mode");
        return 1;
    }

    bfvm::FdSource in(STDIN_FILENO);
    bfvm::FdSink out(STDOUT_FILENO);
    bfvm::Executor executor(in, out);
    bfvm::ProfileInfo prof;
    const bfvm::Status status = executor.execute(code, opts.profile ? &prof : nullptr);
    if (opts.dumpMemory) bfvm::dumpMemory(executor.cells(), executor.cellPtr());
    if (opts.profile) {
        std::cout << "Instructions executed: " << prof.instructions << std::endl;
        std::cout << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    if (!status.ok()) {
        printError(bfvm::describe(status, code));
        return 1;
    }
    return 0;
}

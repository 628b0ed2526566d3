// Spawns the interpreter directly (no shell) and captures its output via a pipe.

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

struct CliResult {
    std::string out;
    int exitCode = -1;
};

static CliResult run_cli(std::vector<std::string> args, const std::string& input = "") {
    args.insert(args.begin(), BFVM_EXE_PATH);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int inPipe[2];
    int outPipe[2];
    assert(pipe(inPipe) == 0);
    assert(pipe(outPipe) == 0);
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(inPipe[1]);
        close(outPipe[0]);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(outPipe[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }
    close(inPipe[0]);
    close(outPipe[1]);
    if (!input.empty()) {
        ssize_t n = write(inPipe[1], input.data(), input.size());
        assert(n == static_cast<ssize_t>(input.size()));
        (void)n;
    }
    close(inPipe[1]);
    std::array<char, 256> buf{};
    CliResult result;
    ssize_t n;
    while ((n = read(outPipe[0], buf.data(), buf.size())) > 0) {
        result.out.append(buf.data(), static_cast<size_t>(n));
    }
    close(outPipe[0]);
    int status;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    result.exitCode = WEXITSTATUS(status);
    return result;
}

int main() {
    const std::string helloA = "++++++++[>++++++++<-]>+.";  // prints 'A'
    CliResult r = run_cli({"-e", helloA});
    assert(r.exitCode == 0);
    assert(r.out == "A");

    r = run_cli({"-e", ",."}, "z");
    assert(r.exitCode == 0);
    assert(r.out == "z");

    r = run_cli({"-e", "+]"});
    assert(r.exitCode == 1);
    assert(r.out.find("Unmatched close bracket at 1:2") != std::string::npos);

    r = run_cli({"-e", "<"});
    assert(r.exitCode == 1);
    assert(r.out.find("Cell pointer moved before start at 1:1") != std::string::npos);

    const char* fname = "cli_program.bf";
    {
        std::ofstream f(fname);
        f << "echo twice\n,..\n";
    }
    r = run_cli({fname}, "q");
    assert(r.exitCode == 0);
    assert(r.out == "qq");

    // A script file wins over inline code.
    r = run_cli({"-e", helloA, fname}, "w");
    assert(r.exitCode == 0);
    assert(r.out == "ww");
    std::remove(fname);

    r = run_cli({"missing_program.bf"});
    assert(r.exitCode == 1);
    assert(r.out.find("Cannot read the script") != std::string::npos);

    r = run_cli({});
    assert(r.exitCode == 1);

    r = run_cli({"-h"});
    assert(r.exitCode == 0);
    assert(r.out.find("Usage:") != std::string::npos);
    return 0;
}

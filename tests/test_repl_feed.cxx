#include <cassert>
#include <string>

#include "repl.hxx"

using bfvm::LineAction;

static void test_complete_line() {
    std::string pending;
    std::string program;
    assert(bfvm::feedLine(pending, "++.", program) == LineAction::Run);
    assert(program == "++.\n");
    assert(pending.empty());
}

static void test_continuation() {
    std::string pending;
    std::string program;
    assert(bfvm::feedLine(pending, "+[", program) == LineAction::Continue);
    assert(bfvm::feedLine(pending, "-[>+<", program) == LineAction::Continue);
    // Commands are plain text while a loop is open.
    assert(bfvm::feedLine(pending, ":dump", program) == LineAction::Continue);
    assert(bfvm::feedLine(pending, "]]", program) == LineAction::Run);
    assert(program == "+[\n-[>+<\n:dump\n]]\n");
    assert(pending.empty());
}

static void test_stray_close_runs() {
    std::string pending;
    std::string program;
    assert(bfvm::feedLine(pending, "+]", program) == LineAction::Run);
    assert(program == "+]\n");
    assert(pending.empty());
}

static void test_exit_and_commands() {
    std::string pending;
    std::string program;
    assert(bfvm::feedLine(pending, "exit", program) == LineAction::Exit);
    assert(bfvm::feedLine(pending, ":dump", program) == LineAction::Command);
    assert(pending.empty());
}

static void test_exit_inside_open_loop() {
    std::string pending;
    std::string program;
    assert(bfvm::feedLine(pending, "+[", program) == LineAction::Continue);
    assert(bfvm::feedLine(pending, "exit", program) == LineAction::Exit);
    assert(pending.empty());
    assert(program.empty());
}

int main() {
    test_complete_line();
    test_continuation();
    test_stray_close_runs();
    test_exit_and_commands();
    test_exit_inside_open_loop();
    return 0;
}

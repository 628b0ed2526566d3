/*
    Bfvm - A minimal brainfuck VM
    Bracket matching
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfvm/loop_resolver.hxx"

#include <cstddef>
#include <string_view>
#include <vector>

namespace bfvm {

Status resolveLoops(std::string_view code, JumpTable& table) {
    table.assign(code.length(), kNoJump);
    std::vector<size_t> stack;
    stack.reserve(code.length() / 2);
    for (size_t i = 0; i < code.length(); ++i) {
        const char ch = code[i];
        if (ch == '[') {
            stack.push_back(i);
        } else if (ch == ']') {
            if (stack.empty()) return {ErrorKind::UnbalancedBrackets, i};
            const size_t start = stack.back();
            stack.pop_back();
            table[start] = i;
            table[i] = start;
        }
    }
    // The bottom of the stack is the earliest bracket that never closed.
    if (!stack.empty()) return {ErrorKind::UnbalancedBrackets, stack.front()};
    return {};
}

}  // namespace bfvm

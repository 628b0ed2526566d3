/*
    Bfvm - A minimal brainfuck VM
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFVM_INITIAL_TAPE_CELLS 30000
#define BFVM_REPL_HISTORY 100

#include <cstddef>
#include <cstdint>

enum class insType : uint8_t {
    ADD,
    SUB,
    PTR_RGT,
    PTR_LFT,
    JMP_ZER,
    JMP_NOT_ZER,
    PUT_CHR,
    RAD_CHR,
    NOP,
};

namespace bfvm {

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

}  // namespace bfvm

#include "bfvm/byte_stream.hxx"
#include "bfvm/error.hxx"
#include "bfvm/loop_resolver.hxx"
#include "bfvm/executor.hxx"

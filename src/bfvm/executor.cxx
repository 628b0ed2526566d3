/*
    Bfvm - A minimal brainfuck VM
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

#include "bfvm.hxx"

namespace {

constexpr std::array<insType, 256> charToOpcode = [] {
    std::array<insType, 256> table{};
    table.fill(insType::NOP);
    table[static_cast<unsigned char>('+')] = insType::ADD;
    table[static_cast<unsigned char>('-')] = insType::SUB;
    table[static_cast<unsigned char>('>')] = insType::PTR_RGT;
    table[static_cast<unsigned char>('<')] = insType::PTR_LFT;
    table[static_cast<unsigned char>('[')] = insType::JMP_ZER;
    table[static_cast<unsigned char>(']')] = insType::JMP_NOT_ZER;
    table[static_cast<unsigned char>('.')] = insType::PUT_CHR;
    table[static_cast<unsigned char>(',')] = insType::RAD_CHR;
    return table;
}();

// Contiguous doubling, never short of `index`.
inline void growTo(std::vector<uint8_t>& cells, size_t index) {
    size_t newSize = std::max<size_t>(cells.size() * 2, 1);
    while (newSize <= index) newSize *= 2;
    cells.resize(newSize, 0);
}

bfvm::Status run(std::vector<uint8_t>& cells, size_t& cellPtr, std::string_view code,
                 const bfvm::JumpTable& jumps, bfvm::ByteSource& in, bfvm::ByteSink& out,
                 std::uint64_t& dispatched) {
    using bfvm::ErrorKind;
    const size_t end = code.length();
    size_t ip = 0;
    while (ip < end) {
        const insType op = charToOpcode[static_cast<unsigned char>(code[ip])];
        if (op != insType::NOP) ++dispatched;
        switch (op) {
            case insType::ADD:
                ++cells[cellPtr];
                break;
            case insType::SUB:
                --cells[cellPtr];
                break;
            case insType::PTR_RGT:
                if (++cellPtr == cells.size()) growTo(cells, cellPtr);
                break;
            case insType::PTR_LFT:
                if (cellPtr == 0) [[unlikely]]
                    return {ErrorKind::PointerUnderflow, ip};
                --cellPtr;
                break;
            case insType::JMP_ZER:
                if (!cells[cellPtr]) ip = jumps[ip];
                break;
            case insType::JMP_NOT_ZER:
                if (cells[cellPtr]) [[likely]]
                    ip = jumps[ip];
                break;
            case insType::PUT_CHR:
                if (std::error_code ec = out.write(cells[cellPtr])) {
                    return {ErrorKind::OutputFailure, ip, ec};
                }
                break;
            case insType::RAD_CHR: {
                std::error_code ec;
                const int ch = in.read(ec);
                if (ec) return {ErrorKind::InputFailure, ip, ec};
                // End of input leaves the cell untouched.
                if (ch != bfvm::ByteSource::kEndOfInput) cells[cellPtr] = static_cast<uint8_t>(ch);
                break;
            }
            case insType::NOP:
                break;
        }
        ++ip;
    }
    return {};
}

}  // namespace

namespace bfvm {

Status execute(std::vector<uint8_t>& cells, size_t& cellPtr, std::string_view code,
               ByteSource& in, ByteSink& out, ProfileInfo* profile) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        profile->seconds = 0.0;
        start = std::chrono::steady_clock::now();
    }
    JumpTable jumps;
    Status status = resolveLoops(code, jumps);
    if (!status.ok()) return status;

    if (cellPtr >= cells.size()) growTo(cells, cellPtr);
    std::uint64_t dispatched = 0;
    status = run(cells, cellPtr, code, jumps, in, out, dispatched);
    if (std::error_code ec = out.flush(); ec && status.ok()) {
        status = {ErrorKind::OutputFailure, code.length(), ec};
    }
    if (profile) {
        profile->instructions = dispatched;
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
    return status;
}

Executor::Executor(ByteSource& in, ByteSink& out)
    : cells_(BFVM_INITIAL_TAPE_CELLS, 0), in_(in), out_(out) {}

Status Executor::execute(std::string_view code, ProfileInfo* profile) {
    return bfvm::execute(cells_, cellPtr_, code, in_, out_, profile);
}

void Executor::reset() {
    cells_.assign(BFVM_INITIAL_TAPE_CELLS, 0);
    cellPtr_ = 0;
}

}  // namespace bfvm

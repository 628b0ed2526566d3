/*
    Bfvm - A minimal brainfuck VM
    Tape inspection helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

namespace bfvm {

// Indices whose value differs between two snapshots. Cells beyond prev.size() count when
// nonzero.
std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cells);

// Rows of ten cells up to the last nonzero cell or the pointer, whichever is further.
void dumpMemory(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out = std::cout,
                const std::vector<size_t>* changed = nullptr, bool highlight = false);

}  // namespace bfvm

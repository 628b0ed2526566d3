/*
    Bfvm - A minimal brainfuck VM
    Tape inspection helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfvm/dump.hxx"

#include <simde/x86/sse2.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "bfvm/ansi.hxx"

namespace bfvm {

std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cells) {
    constexpr size_t simdBytes = 16;
    std::vector<size_t> changed;
    const size_t limit = std::min(prev.size(), cells.size());
    const size_t vecEnd = (limit / simdBytes) * simdBytes;
    for (size_t off = 0; off < vecEnd; off += simdBytes) {
        auto a = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(cells.data() + off));
        auto b = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(prev.data() + off));
        const auto mask = static_cast<uint32_t>(simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(a, b)));
        if (mask == 0xFFFFu) continue;
        for (size_t j = 0; j < simdBytes; ++j) {
            if (!((mask >> j) & 1u)) changed.push_back(off + j);
        }
    }
    for (size_t i = vecEnd; i < limit; ++i) {
        if (cells[i] != prev[i]) changed.push_back(i);
    }
    for (size_t i = limit; i < cells.size(); ++i) {
        if (cells[i]) changed.push_back(i);
    }
    return changed;
}

void dumpMemory(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out,
                const std::vector<size_t>* changed, bool highlight) {
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    // The pointer may sit past the end of a tape that has not grown yet.
    const bool ptrOnTape = cellPtr < cells.size();
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump: " << cells.size() << " cells, pointer at " << cellPtr;
    if (ptrOnTape) out << " = " << +cells[cellPtr];
    out << '\n'
        << ansi::underline << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << ansi::reset
        << std::endl;
    const size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t row = 0; row <= end; row += 10) {
        // '>' marks the row holding the data pointer.
        const bool ptrRow = ptrOnTape && cellPtr / 10 == row / 10;
        std::string label = (ptrRow ? ">" : " ") + std::to_string(row);
        label.resize(std::max<size_t>(label.length(), 8), ' ');
        out << label << '|';
        for (size_t i = row; i < row + 10 && i <= end; ++i) {
            const bool changedCell = highlight && changed &&
                                     std::find(changed->begin(), changed->end(), i) != changed->end();
            const auto& color = i == cellPtr    ? ansi::green
                                : changedCell ? ansi::yellow
                                              : ansi::reset;
            const std::string cellStr = std::to_string(cells[i]);
            out << color << cellStr << ansi::reset << std::string(3 - cellStr.length(), ' ')
                << '|';
        }
        out << '\n';
    }
    out << ansi::reset << std::flush;
}

}  // namespace bfvm

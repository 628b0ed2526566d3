#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "bfvm/byte_stream.hxx"
#include "bfvm/error.hxx"

namespace bfvm {
struct ProfileInfo;

/// @brief Runs a program on a caller-owned tape.
/// @param cells Tape. Grows (zero-filled) when the pointer moves past its end; an empty tape is
/// given one cell before the first instruction.
/// @param cellPtr Data pointer, updated in place. Left where the failing instruction found it.
/// @param code Program text. Brackets are resolved before anything runs, so an unbalanced
/// program never touches `cells`, `cellPtr` or the streams.
/// @param in `,` reads one byte. At end of input the cell is left unchanged.
/// @param out `.` writes one byte. Flushed before returning.
/// @param profile Optional instruction count and wall time.
/// @return ok() once the instruction pointer passes the last character, else the first error.
Status execute(std::vector<uint8_t>& cells, size_t& cellPtr, std::string_view code,
               ByteSource& in, ByteSink& out, ProfileInfo* profile = nullptr);

// Owns a tape and data pointer that persist across execute() calls until reset().
class Executor {
   public:
    Executor(ByteSource& in, ByteSink& out);

    Status execute(std::string_view code, ProfileInfo* profile = nullptr);
    void reset();

    const std::vector<uint8_t>& cells() const { return cells_; }
    size_t cellPtr() const { return cellPtr_; }

   private:
    std::vector<uint8_t> cells_;
    size_t cellPtr_ = 0;
    ByteSource& in_;
    ByteSink& out_;
};
}  // namespace bfvm

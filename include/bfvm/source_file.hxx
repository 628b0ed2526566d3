#pragma once

#include <string>

namespace bfvm {
// Loads a script verbatim using a read-only mapping, with a stream read as fallback.
// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool readSourceFile(const std::string& path, std::string& out, std::string& err);
}  // namespace bfvm

#pragma once

#include <xxhash.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "bfvm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

inline std::string run(std::string_view code, std::vector<uint8_t>& cells, size_t& cellPtr,
                       const std::string& input = "", bfvm::Status* statusOut = nullptr,
                       bfvm::ProfileInfo* profile = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    bfvm::StreamSource source(in);
    bfvm::StreamSink sink(out);
    bfvm::Status status = bfvm::execute(cells, cellPtr, code, source, sink, profile);
    if (statusOut) *statusOut = status;
    return out.str();
}

// Classic 106-character program, prints "Hello World!\n".
inline constexpr std::string_view kHelloWorld =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------.----"
    "----.>>+.>++.";

// Same layout with a comma before the space and no newline: "Hello, World!".
inline constexpr std::string_view kHelloCommaWorld =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>++++++++++++.-------"
    "-----.<-.<.+++.------.--------.>>+.";

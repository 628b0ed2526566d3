/*
    Bfvm - A minimal brainfuck VM
    Byte source/sink abstractions used by the executor
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <system_error>

namespace bfvm {

class ByteSource {
   public:
    static constexpr int kEndOfInput = -1;

    virtual ~ByteSource() = default;

    /// @brief Blocks until a byte is available.
    /// @return The byte in [0,255], or kEndOfInput. On a real failure `ec` is set as well.
    virtual int read(std::error_code& ec) = 0;
};

class ByteSink {
   public:
    virtual ~ByteSink() = default;

    virtual std::error_code write(uint8_t byte) = 0;
    virtual std::error_code flush() { return {}; }
};

class StreamSource final : public ByteSource {
   public:
    explicit StreamSource(std::istream& in) : in_(in) {}
    int read(std::error_code& ec) override;

   private:
    std::istream& in_;
};

class StreamSink final : public ByteSink {
   public:
    explicit StreamSink(std::ostream& out) : out_(out) {}
    std::error_code write(uint8_t byte) override;
    std::error_code flush() override;

   private:
    std::ostream& out_;
};

// Unbuffered POSIX descriptors. The descriptor is not owned.
class FdSource final : public ByteSource {
   public:
    explicit FdSource(int fd) : fd_(fd) {}
    int read(std::error_code& ec) override;

   private:
    int fd_;
};

class FdSink final : public ByteSink {
   public:
    explicit FdSink(int fd) : fd_(fd) {}
    std::error_code write(uint8_t byte) override;

   private:
    int fd_;
};

}  // namespace bfvm

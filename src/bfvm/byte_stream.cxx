/*
    Bfvm - A minimal brainfuck VM
    Stream and file descriptor adapters
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfvm/byte_stream.hxx"

#include <cerrno>
#include <ios>
#include <string>
#include <system_error>

#include <unistd.h>

namespace bfvm {

int StreamSource::read(std::error_code& ec) {
    const auto ch = in_.get();
    if (ch == std::char_traits<char>::eof()) {
        if (in_.bad()) ec = std::make_error_code(std::io_errc::stream);
        return kEndOfInput;
    }
    return static_cast<unsigned char>(std::char_traits<char>::to_char_type(ch));
}

std::error_code StreamSink::write(uint8_t byte) {
    out_.put(static_cast<char>(byte));
    if (!out_) return std::make_error_code(std::io_errc::stream);
    return {};
}

std::error_code StreamSink::flush() {
    out_.flush();
    if (!out_) return std::make_error_code(std::io_errc::stream);
    return {};
}

int FdSource::read(std::error_code& ec) {
    unsigned char byte;
    while (true) {
        const ssize_t n = ::read(fd_, &byte, 1);
        if (n == 1) return byte;
        if (n == 0) return kEndOfInput;
        if (errno != EINTR) {
            ec = std::error_code(errno, std::system_category());
            return kEndOfInput;
        }
    }
}

std::error_code FdSink::write(uint8_t byte) {
    while (true) {
        const ssize_t n = ::write(fd_, &byte, 1);
        if (n == 1) return {};
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) return std::error_code(errno, std::system_category());
        // A zero-length write on a regular descriptor means no progress is possible.
        return std::make_error_code(std::errc::io_error);
    }
}

}  // namespace bfvm

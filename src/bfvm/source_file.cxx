/*
    Bfvm - A minimal brainfuck VM
    Script loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfvm/source_file.hxx"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstddef>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace {
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }
    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};

bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    struct stat st{};
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return false;
    }
    mf.fd = fd;
    if (st.st_size == 0) return true;
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) {
        mf.close();
        return false;
    }
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
}
}  // namespace

namespace bfvm {

bool readSourceFile(const std::string& path, std::string& out, std::string& err) {
    {
        MappedFile mf;
        if (mapFileReadOnly(path, mf)) {
            out.assign(mf.data ? mf.data : "", mf.size);
            return true;
        }
    }
    // Pipes, devices and mapping failures
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "Error while reading file: " + path;
        return false;
    }
    out = std::move(text);
    return true;
}

}  // namespace bfvm

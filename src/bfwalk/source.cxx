/*
    Bfwalk - A tree-walking brainfuck interpreter
    Program file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk/source.hxx"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace bfwalk {

namespace {
#ifndef _WIN32
// Read-only file mapping, released on destruction.
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }

    bool open(const std::string& path) {
        fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) return false;
        struct stat st{};
        if (fstat(fd, &st) != 0) {
            close();
            return false;
        }
        if (st.st_size == 0) return true;
        void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            close();
            return false;
        }
        data = static_cast<const char*>(view);
        size = static_cast<size_t>(st.st_size);
        return true;
    }

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
#endif
}  // namespace

bool isInstruction(char c) noexcept {
    switch (c) {
        case '+':
        case '-':
        case '>':
        case '<':
        case '[':
        case ']':
        case '.':
        case ',':
            return true;
        default:
            return false;
    }
}

std::string stripSource(std::string_view code) {
    std::string out;
    out.reserve(code.size());
    for (char c : code) {
        if (isInstruction(c)) out.push_back(c);
    }
    return out;
}

bool loadSource(const std::string& path, std::string& out, std::string& err, bool strip) {
#ifndef _WIN32
    MappedFile mf;
    if (mf.open(path)) {
        std::string_view view(mf.data ? mf.data : "", mf.size);
        out = strip ? stripSource(view) : std::string(view);
        return true;
    }
#endif
    // Fallback: plain stream read
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + path;
        return false;
    }
    std::string code((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + path;
        return false;
    }
    out = strip ? stripSource(code) : std::move(code);
    return true;
}

}  // namespace bfwalk

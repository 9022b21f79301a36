/*
    Bfwalk - A tree-walking brainfuck interpreter
    Execution context
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk/context.hxx"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>

#include "bfwalk.hxx"

namespace bfwalk {

static inline std::size_t posmod(std::ptrdiff_t x, std::size_t m) {
    std::ptrdiff_t r = x % static_cast<std::ptrdiff_t>(m);
    if (r < 0) r += static_cast<std::ptrdiff_t>(m);
    return static_cast<std::size_t>(r);
}

Context::Context(std::size_t tapeSize, std::uint64_t cycleLimit, std::istream* in,
                 std::ostream& out, std::string_view initialTape)
    : limit(cycleLimit), cycles(cycleLimit), in(in), out(out) {
    if (tapeSize == 0) {
        std::cerr << "warning: tape size must be positive; using default "
                  << BFWALK_DEFAULT_TAPE_SIZE << std::endl;
        tapeSize = BFWALK_DEFAULT_TAPE_SIZE;
    }
    tape.assign(tapeSize, 0);
    if (initialTape.size() > tapeSize) {
        std::cerr << "warning: initial tape data (" << initialTape.size()
                  << " bytes) truncated to tape size " << tapeSize << std::endl;
    }
    const std::size_t count = std::min(initialTape.size(), tapeSize);
    std::copy_n(reinterpret_cast<const uint8_t*>(initialTape.data()), count, tape.begin());
}

void Context::setPointer(std::ptrdiff_t value) noexcept { ptr = posmod(value, tape.size()); }

uint8_t Context::readByte() {
    if (!in) return 0;
    const int ch = in->get();
    if (ch == std::char_traits<char>::eof()) return 0;
    return static_cast<uint8_t>(ch);
}

void Context::writeByte(uint8_t value) {
    out.put(static_cast<char>(value));
    out.flush();
}

Status Context::execute(const node& n) {
    if (cycles == 0) [[unlikely]]
        return Status::CycleLimit;
    --cycles;
    return run(n, *this);
}

}  // namespace bfwalk

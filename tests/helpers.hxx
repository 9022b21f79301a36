#pragma once

#include <xxhash.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

#include "bfwalk.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs a program on a fresh tape with the given input and returns everything it printed.
inline std::string runProgram(std::string_view code, const std::string& input = "",
                       bfwalk::Status* retOut = nullptr, const bfwalk::Options& options = {},
                       bfwalk::ProfileInfo* profile = nullptr,
                       std::string_view initialTape = {}) {
    std::istringstream in(input);
    std::ostringstream out;
    bfwalk::Status ret = bfwalk::execute(code, &in, out, options, profile, initialTape);
    if (retOut) *retOut = ret;
    return out.str();
}

// Parses and runs a program against a caller-owned context so its final state can be checked.
inline bfwalk::Status runIn(bfwalk::Context& ctx, std::string_view code) {
    bfwalk::node program;
    bfwalk::Status ret = bfwalk::parse(code, false, program);
    if (ret != bfwalk::Status::Ok) return ret;
    return bfwalk::run(program, ctx);
}

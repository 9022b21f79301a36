/*
    Bfwalk - A tree-walking brainfuck interpreter
    Top-level entry point
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk.hxx"

#include <chrono>
#include <string_view>

namespace bfwalk {

const char* describe(Status status) noexcept {
    switch (status) {
        case Status::Ok:
            return "OK";
        case Status::UnmatchedClose:
            return "Unmatched close bracket";
        case Status::UnmatchedOpen:
            return "Unmatched open bracket";
        case Status::SyntaxError:
            return "Invalid instruction";
        case Status::CycleLimit:
            return "Cycle limit exceeded";
        case Status::NestingTooDeep:
            return "Loops nested too deeply";
    }
    return "Unknown status";
}

Status execute(std::string_view code, std::istream* in, std::ostream& out,
               const Options& options, ProfileInfo* profile, std::string_view initialTape,
               ParseError* error) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    node program;
    Status ret = parse(code, options.strict, program, error);
    if (ret != Status::Ok) return ret;

    Context ctx(options.tapeSize, options.cycleLimit, in, out, initialTape);
    ret = run(program, ctx);
    if (profile) {
        profile->instructions = ctx.cyclesUsed();
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
    return ret;
}

}  // namespace bfwalk

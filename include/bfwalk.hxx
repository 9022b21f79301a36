/*
    Bfwalk - A tree-walking brainfuck interpreter
    Public API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFWALK_DEFAULT_TAPE_SIZE 65536
#define BFWALK_DEFAULT_CYCLE_LIMIT 16777216
#define BFWALK_DEFAULT_STRICT 0
// Deepest loop nesting the parser accepts. Parser and engine recurse per level.
#define BFWALK_MAX_NESTING 4096
#define BFWALK_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI.
#define BFWALK_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>

namespace bfwalk {

// Numeric values double as the low digit of the CLI exit code.
enum class Status : int {
    Ok = 0,
    UnmatchedClose = 1,
    UnmatchedOpen = 2,
    SyntaxError = 3,
    CycleLimit = 4,
    NestingTooDeep = 5,
};

const char* describe(Status status) noexcept;

struct Options {
    std::size_t tapeSize = BFWALK_DEFAULT_TAPE_SIZE;
    std::uint64_t cycleLimit = BFWALK_DEFAULT_CYCLE_LIMIT;
    // Reject unmatched brackets instead of closing them silently.
    bool strict = BFWALK_DEFAULT_STRICT;
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

}  // namespace bfwalk

#include "bfwalk/ast.hxx"
#include "bfwalk/tokens.hxx"
#include "bfwalk/parser.hxx"
#include "bfwalk/context.hxx"
#include "bfwalk/executor.hxx"

#pragma once

#include <cstddef>
#include <string_view>

namespace bfwalk {
enum class Status : int;
struct node;
class TokenSource;

struct ParseError {
    std::size_t offset = 0;
    char token = '\0';
};

/// @brief Parses instructions until the tokens run out or a ']' closes the block.
/// @param closed Set when the block ended on a ']'.
/// @param depth Loops already open around this block; a '[' at BFWALK_MAX_NESTING fails with
/// Status::NestingTooDeep.
Status parseBlock(TokenSource& tokens, bool strict, node& block, ParseError* error, bool& closed,
                  unsigned depth = 0);

/// @brief Parses a whole program into a BLOCK node. `program` is only written on success.
/// @param strict Report unmatched brackets. Otherwise a missing ']' is closed at the end of the
/// source and a stray ']' ends the program; bytes after it are never read.
/// @param error Filled with the offending byte and its offset on failure, may be null.
Status parse(std::string_view code, bool strict, node& program, ParseError* error = nullptr);

}  // namespace bfwalk

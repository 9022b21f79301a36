#pragma once

#include <iosfwd>
#include <string_view>

namespace bfwalk {
enum class Status : int;
struct node;
class Context;
struct Options;
struct ProfileInfo;
struct ParseError;

/// @brief Runs one node against the context. Children of a BLOCK and every pass of a LOOP body
/// go through Context::execute and are charged there; the node passed in is not.
Status run(const node& n, Context& ctx);

/// @brief Only function you need for a plain run: parses `code`, then executes it on a fresh tape.
/// Nothing is executed when parsing fails.
/// @param code Raw program bytes. Bytes outside the instruction set are a syntax error.
/// @param in Program input. Null or exhausted input reads as 0.
/// @param out Program output, flushed after every byte.
/// @param options Tape size, cycle limit and bracket strictness.
/// @param profile Receives the cycles consumed and the wall time, may be null.
/// @param initialTape Bytes preloaded at the start of the tape.
/// @param error Location of a parse failure, may be null.
/// @return Status::Ok, a parse failure, or Status::CycleLimit. Output written before a cycle
/// limit stays valid.
Status execute(std::string_view code, std::istream* in, std::ostream& out,
               const Options& options, ProfileInfo* profile = nullptr,
               std::string_view initialTape = {}, ParseError* error = nullptr);

}  // namespace bfwalk

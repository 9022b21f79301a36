/*
    Bfwalk - A tree-walking brainfuck interpreter
    Recursive descent parser
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk/parser.hxx"

#include <cstddef>
#include <string_view>
#include <utility>

#include "bfwalk.hxx"

namespace bfwalk {

Status parseBlock(TokenSource& tokens, bool strict, node& block, ParseError* error, bool& closed,
                  unsigned depth) {
    closed = false;
    while (tokens.hasMore()) {
        const std::size_t at = tokens.offset();
        const char ch = tokens.next();
        switch (ch) {
            case '+':
                block.children.push_back(makeLeaf(nodeType::INC));
                break;
            case '-':
                block.children.push_back(makeLeaf(nodeType::DEC));
                break;
            case '>':
                block.children.push_back(makeLeaf(nodeType::MOV_RGT));
                break;
            case '<':
                block.children.push_back(makeLeaf(nodeType::MOV_LFT));
                break;
            case '.':
                block.children.push_back(makeLeaf(nodeType::PUT_CHR));
                break;
            case ',':
                block.children.push_back(makeLeaf(nodeType::RAD_CHR));
                break;
            case '[': {
                // Parsing and running both recurse once per level, so the limit bounds the stack.
                if (depth >= BFWALK_MAX_NESTING) {
                    if (error) *error = {at, ch};
                    return Status::NestingTooDeep;
                }
                node body{nodeType::BLOCK, {}};
                bool bodyClosed = false;
                if (Status ret = parseBlock(tokens, strict, body, error, bodyClosed, depth + 1);
                    ret != Status::Ok)
                    return ret;
                if (strict && !bodyClosed) {
                    if (error) *error = {at, ch};
                    return Status::UnmatchedOpen;
                }
                block.children.push_back(makeLoop(std::move(body)));
                break;
            }
            case ']':
                closed = true;
                return Status::Ok;
            default:
                if (error) *error = {at, ch};
                return Status::SyntaxError;
        }
    }
    return Status::Ok;
}

Status parse(std::string_view code, bool strict, node& program, ParseError* error) {
    TokenSource tokens(code);
    node block{nodeType::BLOCK, {}};
    bool closed = false;
    if (Status ret = parseBlock(tokens, strict, block, error, closed, 0); ret != Status::Ok)
        return ret;
    // A ']' at top level has no loop to close; parsing stops there and the rest is ignored.
    if (closed && strict) {
        if (error) *error = {tokens.offset() - 1, ']'};
        return Status::UnmatchedClose;
    }
    program = std::move(block);
    return Status::Ok;
}

}  // namespace bfwalk

/*
    Bfwalk - A tree-walking brainfuck interpreter
    Syntax tree helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk/ast.hxx"

#include <string>

namespace bfwalk {

const char* nodeName(nodeType op) noexcept {
    switch (op) {
        case nodeType::INC:
            return "Increment";
        case nodeType::DEC:
            return "Decrement";
        case nodeType::MOV_RGT:
            return "MoveRight";
        case nodeType::MOV_LFT:
            return "MoveLeft";
        case nodeType::PUT_CHR:
            return "Print";
        case nodeType::RAD_CHR:
            return "Read";
        case nodeType::LOOP:
            return "Loop";
        case nodeType::BLOCK:
            return "Block";
    }
    __builtin_unreachable();
}

static void append(std::string& out, const node& n) {
    out += nodeName(n.op);
    if (n.op == nodeType::LOOP) {
        out += " (";
        append(out, loopBody(n));
        out += ')';
    } else if (n.op == nodeType::BLOCK) {
        out += ": (";
        for (size_t i = 0; i < n.children.size(); ++i) {
            if (i) out += ", ";
            append(out, n.children[i]);
        }
        out += ')';
    }
}

std::string toString(const node& n) {
    std::string out;
    append(out, n);
    return out;
}

}  // namespace bfwalk

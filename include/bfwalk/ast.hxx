#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace bfwalk {

enum class nodeType : uint8_t {
    INC,
    DEC,
    MOV_RGT,
    MOV_LFT,
    PUT_CHR,
    RAD_CHR,
    LOOP,
    BLOCK,
};

// BLOCK keeps its children in program order, LOOP holds exactly one BLOCK.
// Leaves have no children. Trees are never modified once the parser returns.
struct node {
    nodeType op = nodeType::BLOCK;
    std::vector<node> children;
};

inline node makeLeaf(nodeType op) { return node{op, {}}; }

inline node makeLoop(node body) {
    node loop{nodeType::LOOP, {}};
    loop.children.push_back(std::move(body));
    return loop;
}

inline const node& loopBody(const node& loop) { return loop.children.front(); }

inline bool isLeaf(nodeType op) noexcept { return op != nodeType::LOOP && op != nodeType::BLOCK; }

const char* nodeName(nodeType op) noexcept;

/// @brief Renders a tree as text, e.g. `Block: (Increment, Loop (Block: (Decrement)))`.
std::string toString(const node& n);

}  // namespace bfwalk

/*
    Bfwalk - A tree-walking brainfuck interpreter
    Tree-walking engine
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfwalk/executor.hxx"

#include <cstddef>

#include "bfwalk.hxx"

namespace bfwalk {

Status run(const node& n, Context& ctx) {
    switch (n.op) {
        case nodeType::INC:
            ctx.setCell(ctx.cell() + 1);
            return Status::Ok;
        case nodeType::DEC:
            ctx.setCell(ctx.cell() - 1);
            return Status::Ok;
        case nodeType::MOV_RGT:
            ctx.setPointer(static_cast<std::ptrdiff_t>(ctx.pointer()) + 1);
            return Status::Ok;
        case nodeType::MOV_LFT:
            ctx.setPointer(static_cast<std::ptrdiff_t>(ctx.pointer()) - 1);
            return Status::Ok;
        case nodeType::PUT_CHR:
            ctx.writeByte(ctx.cell());
            return Status::Ok;
        case nodeType::RAD_CHR:
            ctx.setCell(ctx.readByte());
            return Status::Ok;
        case nodeType::LOOP: {
            // Each pass is charged, so loops without leaves still run out of cycles.
            const node& body = loopBody(n);
            while (ctx.cell()) {
                if (Status ret = ctx.execute(body); ret != Status::Ok) return ret;
            }
            return Status::Ok;
        }
        case nodeType::BLOCK:
            for (const node& child : n.children) {
                Status ret = child.op == nodeType::LOOP ? run(child, ctx) : ctx.execute(child);
                if (ret != Status::Ok) [[unlikely]]
                    return ret;
            }
            return Status::Ok;
    }
    __builtin_unreachable();
}

}  // namespace bfwalk

#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Result type of an instruction, computed from its spelled types alone so
// that pass 1 can declare instruction results before any operand is
// resolved.
auto InferResultType(const ast::Instruction& node, Context& ctx)
    -> Result<ir::TypeId>;

// Lowers the body of instruction `id`, whose slot was reserved in pass 1.
// Operand names resolve against the sealed symbol table in `scope`.
auto LowerInstruction(
    const ast::Instruction& node, ir::InstId id, FunctionScope& scope)
    -> Result<void>;

auto LowerTerminator(
    const ast::Terminator& node, ir::BlockId block, FunctionScope& scope)
    -> Result<void>;

}  // namespace llasm::lowering::ast_to_ir

#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/ir/value.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Lower one `[ x, %pred ]` phi operand. `x` is lowered with type `x_type`;
// `%pred` must name a basic block of the enclosing function.
auto LowerIncoming(
    ir::TypeId x_type, const ast::Incoming& node, FunctionScope& scope)
    -> Result<ir::Incoming>;

}  // namespace llasm::lowering::ast_to_ir

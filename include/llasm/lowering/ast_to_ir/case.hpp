#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/value.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Lower one switch arm. The case value goes through the context's
// ConstantLowerer and the target label through the function's symbol
// table. Either half failing fails the whole arm; the diagnostic carries a
// note naming the half that failed.
auto LowerCase(const ast::Case& node, FunctionScope& scope)
    -> Result<ir::Case>;

}  // namespace llasm::lowering::ast_to_ir

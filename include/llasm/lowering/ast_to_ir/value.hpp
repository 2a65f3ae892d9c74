#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/ir/value.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Lower an operand that must have type `expected`.
// `%name` resolves through the function's symbol table, `@name` through the
// module's global table; anything else is a constant.
auto LowerValue(
    ir::TypeId expected, const ast::Value& value, FunctionScope& scope)
    -> Result<ir::Operand>;

// `<type> <value>`.
auto LowerTypedValue(const ast::TypedValue& node, FunctionScope& scope)
    -> Result<ir::Operand>;

}  // namespace llasm::lowering::ast_to_ir

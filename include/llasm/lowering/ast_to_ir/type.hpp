#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Lower a type spelling to an interned TypeId.
// Returns kUnsupported for type spellings outside the supported set and
// kError for an invalid integer width or address space.
auto LowerType(const ast::Type& node, Context& ctx) -> Result<ir::TypeId>;

}  // namespace llasm::lowering::ast_to_ir

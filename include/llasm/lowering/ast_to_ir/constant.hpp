#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"

namespace llasm::lowering::ast_to_ir {

// Lowers a constant operand of a known type into the module's constant
// arena. Case lowering and global initializers go through this interface
// so tests can substitute their own implementation.
class ConstantLowerer {
 public:
  ConstantLowerer() = default;
  virtual ~ConstantLowerer() = default;

  ConstantLowerer(const ConstantLowerer&) = delete;
  ConstantLowerer(ConstantLowerer&&) = delete;
  auto operator=(const ConstantLowerer&) -> ConstantLowerer& = delete;
  auto operator=(ConstantLowerer&&) -> ConstantLowerer& = delete;

  virtual auto LowerConstant(
      ir::TypeId type, const ast::Value& value, Context& ctx)
      -> Result<ir::ConstId> = 0;
};

// Integer, boolean, floating-point, null, undef, zeroinitializer and
// global-address constants.
class DefaultConstantLowerer final : public ConstantLowerer {
 public:
  auto LowerConstant(ir::TypeId type, const ast::Value& value, Context& ctx)
      -> Result<ir::ConstId> override;
};

// `<type> <constant>`: lowers the type, then the value through
// ctx.constant_lowerer.
auto LowerTypedConstant(const ast::TypedValue& node, Context& ctx)
    -> Result<ir::ConstId>;

}  // namespace llasm::lowering::ast_to_ir

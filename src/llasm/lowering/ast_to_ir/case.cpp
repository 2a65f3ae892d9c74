#include "llasm/lowering/ast_to_ir/case.hpp"

#include <expected>
#include <utility>

#include "llasm/lowering/ast_to_ir/constant.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"

namespace llasm::lowering::ast_to_ir {

auto LowerCase(const ast::Case& node, FunctionScope& scope)
    -> Result<ir::Case> {
  auto x_or_err = LowerTypedConstant(node.x, *scope.ctx);
  if (!x_or_err) {
    return std::unexpected(
        std::move(x_or_err.error()).WithNote(node.span, "in switch case value"));
  }

  auto target_or_err =
      scope.locals->ResolveBlock(DecodeLocal(node.target), node.target.span);
  if (!target_or_err) {
    return std::unexpected(
        std::move(target_or_err.error())
            .WithNote(node.span, "in switch case target"));
  }

  return ir::Case{.x = *x_or_err, .target = *target_or_err};
}

}  // namespace llasm::lowering::ast_to_ir

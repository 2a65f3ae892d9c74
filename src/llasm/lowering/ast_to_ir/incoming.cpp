#include "llasm/lowering/ast_to_ir/incoming.hpp"

#include <expected>
#include <utility>

#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/value.hpp"

namespace llasm::lowering::ast_to_ir {

auto LowerIncoming(
    ir::TypeId x_type, const ast::Incoming& node, FunctionScope& scope)
    -> Result<ir::Incoming> {
  auto x_or_err = LowerValue(x_type, node.x, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());

  auto pred_or_err =
      scope.locals->ResolveBlock(DecodeLocal(node.pred), node.pred.span);
  if (!pred_or_err) {
    return std::unexpected(
        std::move(pred_or_err.error())
            .WithNote(node.span, "in phi predecessor"));
  }

  return ir::Incoming{.x = *x_or_err, .pred = *pred_or_err};
}

}  // namespace llasm::lowering::ast_to_ir

#include "llasm/lowering/ast_to_ir/value.hpp"

#include <expected>
#include <variant>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/lowering/ast_to_ir/constant.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/type.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

auto ResolveIdentifier(const ast::RawIdentifier& id, FunctionScope& scope)
    -> Result<ir::Operand> {
  if (id.kind == ast::IdentKind::kGlobal) {
    auto ref_or_err = scope.ctx->globals->Resolve(DecodeGlobal(id), id.span);
    if (!ref_or_err) return std::unexpected(ref_or_err.error());
    return *ref_or_err;
  }
  return scope.locals->ResolveValue(DecodeLocal(id), id.span);
}

}  // namespace

auto LowerValue(
    ir::TypeId expected, const ast::Value& value, FunctionScope& scope)
    -> Result<ir::Operand> {
  const auto* id = std::get_if<ast::RawIdentifier>(&value);
  if (id == nullptr) {
    auto const_or_err =
        scope.ctx->constant_lowerer->LowerConstant(expected, value, *scope.ctx);
    if (!const_or_err) return std::unexpected(const_or_err.error());
    return *const_or_err;
  }

  if (scope.locals == nullptr || scope.ctx->globals == nullptr) {
    throw common::InternalError(
        "LowerValue", "symbol tables not available for operand lookup");
  }

  auto operand_or_err = ResolveIdentifier(*id, scope);
  if (!operand_or_err) return std::unexpected(operand_or_err.error());

  ir::TypeId actual =
      ir::OperandType(*scope.ctx->module, *scope.func, *operand_or_err);
  if (actual != expected) {
    const auto& types = scope.ctx->Types();
    return std::unexpected(
        Diagnostic::Error(
            id->span, fmt::format(
                          "'{}' defined with type '{}' but expected '{}'",
                          id->text, ir::ToString(types[actual]),
                          ir::ToString(types[expected])))
            .WithCode(DiagCode::kTypeMismatch, id->text));
  }
  return *operand_or_err;
}

auto LowerTypedValue(const ast::TypedValue& node, FunctionScope& scope)
    -> Result<ir::Operand> {
  auto type_or_err = LowerType(node.type, *scope.ctx);
  if (!type_or_err) return std::unexpected(type_or_err.error());
  return LowerValue(*type_or_err, node.value, scope);
}

}  // namespace llasm::lowering::ast_to_ir

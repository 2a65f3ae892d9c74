#include "llasm/lowering/ast_to_ir/instruction.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "absl/container/flat_hash_set.h"
#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"
#include "llasm/ir/instruction.hpp"
#include "llasm/lowering/ast_to_ir/case.hpp"
#include "llasm/lowering/ast_to_ir/enum_resolver.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/incoming.hpp"
#include "llasm/lowering/ast_to_ir/literal.hpp"
#include "llasm/lowering/ast_to_ir/type.hpp"
#include "llasm/lowering/ast_to_ir/value.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

auto TypeName(FunctionScope& scope, ir::TypeId id) -> std::string {
  return ir::ToString(scope.ctx->Types()[id]);
}

auto TypeMismatch(SourceSpan span, std::string msg, std::string subject)
    -> Diagnostic {
  return Diagnostic::Error(span, std::move(msg))
      .WithCode(DiagCode::kTypeMismatch, std::move(subject));
}

// Lowers a spelled operand type and checks it with `accepts`.
template <typename Pred>
auto LowerOperandType(
    const ast::Type& node, FunctionScope& scope, Pred accepts,
    const char* construct) -> Result<ir::TypeId> {
  auto type_or_err = LowerType(node, *scope.ctx);
  if (!type_or_err) return std::unexpected(type_or_err.error());
  if (!accepts(scope.ctx->Types()[*type_or_err])) {
    return std::unexpected(TypeMismatch(
        node.span,
        fmt::format("invalid operand type '{}' for {}", node.text, construct),
        node.text));
  }
  return *type_or_err;
}

auto LowerBlockRef(const ast::RawIdentifier& id, FunctionScope& scope)
    -> Result<ir::BlockId> {
  return scope.locals->ResolveBlock(DecodeLocal(id), id.span);
}

auto LowerPhi(const ast::PhiInst& n, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  auto type_or_err = LowerOperandType(
      n.type, scope, [](const ir::Type& t) { return !t.IsVoid() && !t.IsLabel(); },
      "phi");
  if (!type_or_err) return std::unexpected(type_or_err.error());

  ir::PhiInst phi;
  phi.incomings.reserve(n.incomings.size());
  for (const auto& incoming : n.incomings) {
    auto inc_or_err = LowerIncoming(*type_or_err, incoming, scope);
    if (!inc_or_err) return std::unexpected(inc_or_err.error());
    phi.incomings.push_back(*inc_or_err);
  }
  return phi;
}

auto LowerBinary(const ast::BinaryInst& n, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  ir::BinaryOpcode opcode = ResolveBinaryOpcode(n.opcode);
  if (!n.overflow_flags.empty() && !ir::AcceptsOverflowFlags(opcode)) {
    throw common::InternalError(
        "LowerInstruction",
        fmt::format("overflow flags on '{}'", n.opcode.text));
  }
  if (n.exact && !ir::AcceptsExact(opcode)) {
    throw common::InternalError(
        "LowerInstruction", fmt::format("'exact' on '{}'", n.opcode.text));
  }

  auto type_or_err = LowerOperandType(
      n.type, scope, [](const ir::Type& t) { return t.IsInteger(); },
      n.opcode.text.c_str());
  if (!type_or_err) return std::unexpected(type_or_err.error());

  auto x_or_err = LowerValue(*type_or_err, n.x, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());
  auto y_or_err = LowerValue(*type_or_err, n.y, scope);
  if (!y_or_err) return std::unexpected(y_or_err.error());

  return ir::BinaryInst{
      .opcode = opcode,
      .overflow_flags = ResolveOverflowFlags(n.overflow_flags),
      .exact = DecodeFlag(n.exact),
      .x = *x_or_err,
      .y = *y_or_err,
  };
}

auto LowerICmp(const ast::ICmpInst& n, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  ir::IPred pred = ResolveIPred(n.pred);
  auto type_or_err = LowerOperandType(
      n.type, scope,
      [](const ir::Type& t) { return t.IsInteger() || t.IsPointer(); }, "icmp");
  if (!type_or_err) return std::unexpected(type_or_err.error());

  auto x_or_err = LowerValue(*type_or_err, n.x, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());
  auto y_or_err = LowerValue(*type_or_err, n.y, scope);
  if (!y_or_err) return std::unexpected(y_or_err.error());

  return ir::ICmpInst{.pred = pred, .x = *x_or_err, .y = *y_or_err};
}

auto LowerFCmp(const ast::FCmpInst& n, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  ir::FPred pred = ResolveFPred(n.pred);
  auto type_or_err = LowerOperandType(
      n.type, scope, [](const ir::Type& t) { return t.IsFloat(); }, "fcmp");
  if (!type_or_err) return std::unexpected(type_or_err.error());

  auto x_or_err = LowerValue(*type_or_err, n.x, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());
  auto y_or_err = LowerValue(*type_or_err, n.y, scope);
  if (!y_or_err) return std::unexpected(y_or_err.error());

  return ir::FCmpInst{
      .fast_math_flags = ResolveFastMathFlags(n.fast_math_flags),
      .pred = pred,
      .x = *x_or_err,
      .y = *y_or_err,
  };
}

// Direct calls are checked against the callee's signature.
auto CheckCallSignature(
    const ast::CallInst& n, SourceSpan span, ir::GlobalRef callee,
    ir::TypeId return_type, const std::vector<ir::TypeId>& arg_types,
    FunctionScope& scope) -> Result<void> {
  const ir::Function& func = scope.ctx->module->Func(callee);
  if (!func.return_type) {
    // Header failed to lower; already reported.
    return {};
  }
  const auto* callee_id = std::get_if<ast::RawIdentifier>(&n.callee);
  std::string callee_name = callee_id != nullptr ? callee_id->text : func.name;

  if (func.return_type != return_type) {
    return std::unexpected(TypeMismatch(
        n.return_type.span,
        fmt::format(
            "call to '{}' expects return type '{}', got '{}'", callee_name,
            TypeName(scope, func.return_type), TypeName(scope, return_type)),
        callee_name));
  }
  size_t params = func.params.size();
  if (arg_types.size() < params ||
      (!func.variadic && arg_types.size() != params)) {
    return std::unexpected(TypeMismatch(
        span,
        fmt::format(
            "call to '{}' passes {} arguments; function takes {}{}",
            callee_name, arg_types.size(), params,
            func.variadic ? " or more" : ""),
        callee_name));
  }
  for (size_t i = 0; i < params; ++i) {
    if (arg_types[i] != func.params[i].type) {
      return std::unexpected(TypeMismatch(
          n.args[i].span,
          fmt::format(
              "argument {} of call to '{}' has type '{}'; expected '{}'", i,
              callee_name, TypeName(scope, arg_types[i]),
              TypeName(scope, func.params[i].type)),
          callee_name));
    }
  }
  return {};
}

auto LowerCall(const ast::CallInst& n, SourceSpan span, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  auto cc_or_err = ResolveOptionalCallingConv(n.calling_conv);
  if (!cc_or_err) return std::unexpected(cc_or_err.error());

  auto ret_or_err = LowerType(n.return_type, *scope.ctx);
  if (!ret_or_err) return std::unexpected(ret_or_err.error());

  auto callee_or_err =
      LowerValue(scope.ctx->builtin_types.ptr_type, n.callee, scope);
  if (!callee_or_err) return std::unexpected(callee_or_err.error());

  ir::CallInst call{
      .tail = ResolveOptionalTail(n.tail),
      .calling_conv = *cc_or_err,
      .callee = *callee_or_err,
      .args = {},
  };
  std::vector<ir::TypeId> arg_types;
  arg_types.reserve(n.args.size());
  call.args.reserve(n.args.size());
  for (const auto& arg : n.args) {
    auto type_or_err = LowerType(arg.type, *scope.ctx);
    if (!type_or_err) return std::unexpected(type_or_err.error());
    auto arg_or_err = LowerValue(*type_or_err, arg.value, scope);
    if (!arg_or_err) return std::unexpected(arg_or_err.error());
    arg_types.push_back(*type_or_err);
    call.args.push_back(*arg_or_err);
  }

  const auto* global = std::get_if<ir::GlobalRef>(&call.callee);
  if (global != nullptr && global->kind == ir::GlobalKind::kFunction) {
    auto check = CheckCallSignature(
        n, span, *global, *ret_or_err, arg_types, scope);
    if (!check) return std::unexpected(check.error());
  }
  return call;
}

auto AcceptsAtomicOperand(ir::AtomicOp op, const ir::Type& type) -> bool {
  switch (op) {
    case ir::AtomicOp::kXchg:
      return type.IsInteger() || type.IsFloat() || type.IsPointer();
    case ir::AtomicOp::kFAdd:
    case ir::AtomicOp::kFSub:
      return type.IsFloat();
    default:
      return type.IsInteger();
  }
}

auto LowerAtomicRMW(
    const ast::AtomicRMWInst& n, SourceSpan span, FunctionScope& scope)
    -> Result<ir::InstPayload> {
  ir::AtomicOp op = ResolveAtomicOp(n.op);
  ir::AtomicOrdering ordering = ResolveAtomicOrdering(n.ordering);
  if (ordering == ir::AtomicOrdering::kUnordered) {
    return std::unexpected(
        Diagnostic::Error(n.ordering.span, "atomicrmw cannot be unordered")
            .WithCode(DiagCode::kInvalidOperand, n.ordering.text));
  }

  auto ptr_type_or_err = LowerOperandType(
      n.ptr.type, scope, [](const ir::Type& t) { return t.IsPointer(); },
      "atomicrmw address");
  if (!ptr_type_or_err) return std::unexpected(ptr_type_or_err.error());
  auto ptr_or_err = LowerValue(*ptr_type_or_err, n.ptr.value, scope);
  if (!ptr_or_err) return std::unexpected(ptr_or_err.error());

  auto x_type_or_err = LowerOperandType(
      n.x.type, scope,
      [op](const ir::Type& t) { return AcceptsAtomicOperand(op, t); },
      "atomicrmw operation");
  if (!x_type_or_err) {
    return std::unexpected(
        std::move(x_type_or_err.error())
            .WithNote(span, fmt::format("in atomicrmw {}", n.op.text)));
  }
  auto x_or_err = LowerValue(*x_type_or_err, n.x.value, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());

  return ir::AtomicRMWInst{
      .is_volatile = DecodeFlag(n.is_volatile),
      .op = op,
      .ptr = *ptr_or_err,
      .x = *x_or_err,
      .ordering = ordering,
  };
}

auto LowerFence(const ast::FenceInst& n) -> Result<ir::InstPayload> {
  ir::AtomicOrdering ordering = ResolveAtomicOrdering(n.ordering);
  switch (ordering) {
    case ir::AtomicOrdering::kAcquire:
    case ir::AtomicOrdering::kRelease:
    case ir::AtomicOrdering::kAcqRel:
    case ir::AtomicOrdering::kSeqCst:
      return ir::FenceInst{.ordering = ordering};
    default:
      return std::unexpected(
          Diagnostic::Error(
              n.ordering.span,
              "fence ordering must be acquire, release, acq_rel or seq_cst")
              .WithCode(DiagCode::kInvalidOperand, n.ordering.text));
  }
}

auto LowerRet(const ast::RetTerm& n, SourceSpan span, FunctionScope& scope)
    -> Result<ir::Terminator> {
  ir::TypeId expected = scope.func->return_type;
  if (!n.value) {
    if (expected != scope.ctx->builtin_types.void_type) {
      return std::unexpected(TypeMismatch(
          span,
          fmt::format(
              "'ret void' in function returning '{}'",
              TypeName(scope, expected)),
          "void"));
    }
    return ir::RetTerm{};
  }

  auto type_or_err = LowerType(n.value->type, *scope.ctx);
  if (!type_or_err) return std::unexpected(type_or_err.error());
  if (*type_or_err != expected) {
    return std::unexpected(TypeMismatch(
        n.value->type.span,
        fmt::format(
            "returned type '{}' does not match function return type '{}'",
            n.value->type.text, TypeName(scope, expected)),
        n.value->type.text));
  }
  auto value_or_err = LowerValue(expected, n.value->value, scope);
  if (!value_or_err) return std::unexpected(value_or_err.error());
  return ir::RetTerm{.value = *value_or_err};
}

auto LowerCondBr(const ast::CondBrTerm& n, FunctionScope& scope)
    -> Result<ir::Terminator> {
  auto type_or_err = LowerOperandType(
      n.cond.type, scope,
      [](const ir::Type& t) {
        return t.IsInteger() && t.AsInteger().bit_width == 1;
      },
      "branch condition");
  if (!type_or_err) return std::unexpected(type_or_err.error());
  auto cond_or_err = LowerValue(*type_or_err, n.cond.value, scope);
  if (!cond_or_err) return std::unexpected(cond_or_err.error());

  auto true_or_err = LowerBlockRef(n.target_true, scope);
  if (!true_or_err) return std::unexpected(true_or_err.error());
  auto false_or_err = LowerBlockRef(n.target_false, scope);
  if (!false_or_err) return std::unexpected(false_or_err.error());

  return ir::CondBrTerm{
      .cond = *cond_or_err,
      .target_true = *true_or_err,
      .target_false = *false_or_err,
  };
}

auto LowerSwitch(const ast::SwitchTerm& n, FunctionScope& scope)
    -> Result<ir::Terminator> {
  auto type_or_err = LowerOperandType(
      n.x.type, scope, [](const ir::Type& t) { return t.IsInteger(); },
      "switch");
  if (!type_or_err) return std::unexpected(type_or_err.error());
  auto x_or_err = LowerValue(*type_or_err, n.x.value, scope);
  if (!x_or_err) return std::unexpected(x_or_err.error());
  auto default_or_err = LowerBlockRef(n.default_target, scope);
  if (!default_or_err) return std::unexpected(default_or_err.error());

  ir::SwitchTerm term{
      .x = *x_or_err,
      .default_target = *default_or_err,
      .cases = {},
  };
  term.cases.reserve(n.cases.size());
  // Constants are interned, so equal case values share a ConstId.
  absl::flat_hash_set<uint32_t> seen;
  for (const auto& arm : n.cases) {
    auto case_or_err = LowerCase(arm, scope);
    if (!case_or_err) return std::unexpected(case_or_err.error());

    ir::TypeId case_type = scope.ctx->module->constants[case_or_err->x].type;
    if (case_type != *type_or_err) {
      return std::unexpected(TypeMismatch(
          arm.x.type.span,
          fmt::format(
              "case value type '{}' does not match switch condition type '{}'",
              arm.x.type.text, n.x.type.text),
          arm.x.type.text));
    }
    if (!seen.insert(case_or_err->x.value).second) {
      return std::unexpected(
          Diagnostic::Error(arm.x.span, "duplicate case value in switch")
              .WithCode(DiagCode::kInvalidOperand, arm.x.type.text));
    }
    term.cases.push_back(*case_or_err);
  }
  return term;
}

}  // namespace

auto InferResultType(const ast::Instruction& node, Context& ctx)
    -> Result<ir::TypeId> {
  return std::visit(
      Overloaded{
          [&](const ast::PhiInst& n) { return LowerType(n.type, ctx); },
          [&](const ast::BinaryInst& n) { return LowerType(n.type, ctx); },
          [&](const ast::ICmpInst& /*n*/) -> Result<ir::TypeId> {
            return ctx.builtin_types.bool_type;
          },
          [&](const ast::FCmpInst& /*n*/) -> Result<ir::TypeId> {
            return ctx.builtin_types.bool_type;
          },
          [&](const ast::CallInst& n) { return LowerType(n.return_type, ctx); },
          [&](const ast::AtomicRMWInst& n) { return LowerType(n.x.type, ctx); },
          [&](const ast::FenceInst& /*n*/) -> Result<ir::TypeId> {
            return ctx.builtin_types.void_type;
          },
      },
      node.inst);
}

auto LowerInstruction(
    const ast::Instruction& node, ir::InstId id, FunctionScope& scope)
    -> Result<void> {
  if (!scope.func->Inst(id).IsPending()) {
    throw common::InternalError(
        "LowerInstruction",
        fmt::format("instruction {} lowered twice", id.value));
  }

  auto payload_or_err = std::visit(
      Overloaded{
          [&](const ast::PhiInst& n) { return LowerPhi(n, scope); },
          [&](const ast::BinaryInst& n) { return LowerBinary(n, scope); },
          [&](const ast::ICmpInst& n) { return LowerICmp(n, scope); },
          [&](const ast::FCmpInst& n) { return LowerFCmp(n, scope); },
          [&](const ast::CallInst& n) { return LowerCall(n, node.span, scope); },
          [&](const ast::AtomicRMWInst& n) {
            return LowerAtomicRMW(n, node.span, scope);
          },
          [&](const ast::FenceInst& n) { return LowerFence(n); },
      },
      node.inst);
  if (!payload_or_err) return std::unexpected(payload_or_err.error());

  scope.func->MutableInst(id).payload = std::move(*payload_or_err);
  return {};
}

auto LowerTerminator(
    const ast::Terminator& node, ir::BlockId block, FunctionScope& scope)
    -> Result<void> {
  if (!std::holds_alternative<ir::PendingTerm>(scope.func->Block(block).term)) {
    throw common::InternalError(
        "LowerTerminator",
        fmt::format("terminator of block {} lowered twice", block.value));
  }

  auto term_or_err = std::visit(
      Overloaded{
          [&](const ast::RetTerm& n) { return LowerRet(n, node.span, scope); },
          [&](const ast::BrTerm& n) -> Result<ir::Terminator> {
            auto target_or_err = LowerBlockRef(n.target, scope);
            if (!target_or_err) return std::unexpected(target_or_err.error());
            return ir::BrTerm{.target = *target_or_err};
          },
          [&](const ast::CondBrTerm& n) { return LowerCondBr(n, scope); },
          [&](const ast::SwitchTerm& n) { return LowerSwitch(n, scope); },
          [&](const ast::UnreachableTerm& /*n*/) -> Result<ir::Terminator> {
            return ir::UnreachableTerm{};
          },
      },
      node.term);
  if (!term_or_err) return std::unexpected(term_or_err.error());

  scope.func->MutableBlock(block).term = std::move(*term_or_err);
  return {};
}

}  // namespace llasm::lowering::ast_to_ir

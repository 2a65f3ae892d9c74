#include "llasm/lowering/ast_to_ir/enum_resolver.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <variant>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"
#include "llasm/ir/enum_table.hpp"
#include "llasm/lowering/ast_to_ir/literal.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

template <typename E, size_t N>
auto Lookup(
    const std::array<ir::KeywordSpelling<E>, N>& table, const ast::Keyword& kw,
    const char* category) -> E {
  auto value = ir::FindByKeyword(table, kw.text);
  if (!value) {
    throw common::InternalError(
        "EnumResolver",
        fmt::format("support for {} '{}' not yet implemented", category,
                    kw.text));
  }
  return *value;
}

template <typename E, size_t N>
auto LookupOptional(
    const std::array<ir::KeywordSpelling<E>, N>& table,
    const std::optional<ast::Keyword>& kw, const char* category, E none) -> E {
  if (!kw) {
    return none;
  }
  return Lookup(table, *kw, category);
}

}  // namespace

auto ResolveLinkage(const ast::Keyword& kw) -> ir::Linkage {
  return Lookup(ir::kLinkageTable, kw, "linkage");
}

auto ResolveOptionalLinkage(const std::optional<ast::Keyword>& kw)
    -> ir::Linkage {
  return LookupOptional(ir::kLinkageTable, kw, "linkage", ir::Linkage::kNone);
}

auto ResolveVisibility(const ast::Keyword& kw) -> ir::Visibility {
  return Lookup(ir::kVisibilityTable, kw, "visibility");
}

auto ResolveOptionalVisibility(const std::optional<ast::Keyword>& kw)
    -> ir::Visibility {
  return LookupOptional(
      ir::kVisibilityTable, kw, "visibility", ir::Visibility::kNone);
}

auto ResolveDllStorageClass(const ast::Keyword& kw) -> ir::DllStorageClass {
  return Lookup(ir::kDllStorageClassTable, kw, "DLL storage class");
}

auto ResolveOptionalDllStorageClass(const std::optional<ast::Keyword>& kw)
    -> ir::DllStorageClass {
  return LookupOptional(
      ir::kDllStorageClassTable, kw, "DLL storage class",
      ir::DllStorageClass::kNone);
}

auto ResolvePreemption(const ast::Keyword& kw) -> ir::Preemption {
  return Lookup(ir::kPreemptionTable, kw, "preemption specifier");
}

auto ResolveOptionalPreemption(const std::optional<ast::Keyword>& kw)
    -> ir::Preemption {
  return LookupOptional(
      ir::kPreemptionTable, kw, "preemption specifier",
      ir::Preemption::kNone);
}

auto ResolveUnnamedAddr(const ast::Keyword& kw) -> ir::UnnamedAddr {
  return Lookup(ir::kUnnamedAddrTable, kw, "unnamed_addr");
}

auto ResolveOptionalUnnamedAddr(const std::optional<ast::Keyword>& kw)
    -> ir::UnnamedAddr {
  return LookupOptional(
      ir::kUnnamedAddrTable, kw, "unnamed_addr", ir::UnnamedAddr::kNone);
}

auto ResolveTlsModel(const ast::Keyword& kw) -> ir::TlsModel {
  return Lookup(ir::kTlsModelTable, kw, "thread local storage model");
}

auto ResolveThreadLocal(const std::optional<ast::ThreadLocal>& node)
    -> ir::TlsModel {
  if (!node) {
    return ir::TlsModel::kNone;
  }
  if (!node->model) {
    return ir::TlsModel::kGeneralDynamic;
  }
  return ResolveTlsModel(*node->model);
}

auto ResolveSelectionKind(const ast::Keyword& kw) -> ir::SelectionKind {
  return Lookup(ir::kSelectionKindTable, kw, "comdat selection kind");
}

auto ResolveOptionalSelectionKind(const std::optional<ast::Keyword>& kw)
    -> ir::SelectionKind {
  return LookupOptional(
      ir::kSelectionKindTable, kw, "comdat selection kind",
      ir::SelectionKind::kAny);
}

auto ResolveCallingConv(const ast::CallingConv& node)
    -> Result<ir::CallingConv> {
  return std::visit(
      Overloaded{
          [](const ast::CallingConvEnum& named) -> Result<ir::CallingConv> {
            return Lookup(
                ir::kCallingConvTable, named.keyword, "calling convention");
          },
          [](const ast::CallingConvInt& numeric) -> Result<ir::CallingConv> {
            uint64_t code = DecodeUint(numeric.code);
            auto value = ir::FindNumericCallingConv(code);
            if (!value) {
              return std::unexpected(
                  Diagnostic::Unsupported(
                      numeric.span,
                      fmt::format(
                          "support for calling convention 'cc {}' not yet "
                          "implemented",
                          code),
                      UnsupportedCategory::kOperation)
                      .WithCode(
                          DiagCode::kUnsupportedCallingConvention,
                          numeric.code.text));
            }
            return *value;
          },
      },
      node);
}

auto ResolveOptionalCallingConv(const std::optional<ast::CallingConv>& node)
    -> Result<ir::CallingConv> {
  if (!node) {
    return ir::CallingConv::kNone;
  }
  return ResolveCallingConv(*node);
}

auto ResolveAtomicOrdering(const ast::Keyword& kw) -> ir::AtomicOrdering {
  return Lookup(ir::kAtomicOrderingTable, kw, "atomic ordering");
}

auto ResolveAtomicOp(const ast::Keyword& kw) -> ir::AtomicOp {
  return Lookup(ir::kAtomicOpTable, kw, "atomic operation");
}

auto ResolveIPred(const ast::Keyword& kw) -> ir::IPred {
  return Lookup(ir::kIPredTable, kw, "integer comparison predicate");
}

auto ResolveFPred(const ast::Keyword& kw) -> ir::FPred {
  return Lookup(ir::kFPredTable, kw, "floating-point comparison predicate");
}

auto ResolveTail(const ast::Keyword& kw) -> ir::Tail {
  return Lookup(ir::kTailTable, kw, "tail call marker");
}

auto ResolveOptionalTail(const std::optional<ast::Keyword>& kw) -> ir::Tail {
  return LookupOptional(ir::kTailTable, kw, "tail call marker", ir::Tail::kNone);
}

auto ResolveFastMathFlag(const ast::Keyword& kw) -> ir::FastMathFlag {
  return Lookup(ir::kFastMathFlagTable, kw, "fast-math flag");
}

auto ResolveOverflowFlag(const ast::Keyword& kw) -> ir::OverflowFlag {
  return Lookup(ir::kOverflowFlagTable, kw, "overflow flag");
}

auto ResolveFastMathFlags(std::span<const ast::Keyword> kws)
    -> ir::FastMathFlags {
  ir::FastMathFlags flags;
  for (const auto& kw : kws) {
    flags.Set(ResolveFastMathFlag(kw));
  }
  return flags;
}

auto ResolveOverflowFlags(std::span<const ast::Keyword> kws)
    -> ir::OverflowFlags {
  ir::OverflowFlags flags;
  for (const auto& kw : kws) {
    flags.Set(ResolveOverflowFlag(kw));
  }
  return flags;
}

auto ResolveImmutable(const ast::Keyword& kw) -> ir::Immutable {
  return Lookup(ir::kImmutableTable, kw, "global kind");
}

auto ResolveBinaryOpcode(const ast::Keyword& kw) -> ir::BinaryOpcode {
  return Lookup(ir::kBinaryOpcodeTable, kw, "binary opcode");
}

}  // namespace llasm::lowering::ast_to_ir

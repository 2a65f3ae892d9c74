#pragma once

#include <optional>
#include <span>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/enums.hpp"

namespace llasm::lowering::ast_to_ir {

// Keyword -> enum resolution for every closed attribute vocabulary.
//
// The vocabularies are definitional: a spelling missing from its table means
// the parser accepted something the grammar does not allow, so Resolve*
// throws InternalError rather than guessing. The Optional forms map a
// missing node to the category's kNone sentinel through the same path.

auto ResolveLinkage(const ast::Keyword& kw) -> ir::Linkage;
auto ResolveOptionalLinkage(const std::optional<ast::Keyword>& kw)
    -> ir::Linkage;

auto ResolveVisibility(const ast::Keyword& kw) -> ir::Visibility;
auto ResolveOptionalVisibility(const std::optional<ast::Keyword>& kw)
    -> ir::Visibility;

auto ResolveDllStorageClass(const ast::Keyword& kw) -> ir::DllStorageClass;
auto ResolveOptionalDllStorageClass(const std::optional<ast::Keyword>& kw)
    -> ir::DllStorageClass;

auto ResolvePreemption(const ast::Keyword& kw) -> ir::Preemption;
auto ResolveOptionalPreemption(const std::optional<ast::Keyword>& kw)
    -> ir::Preemption;

auto ResolveUnnamedAddr(const ast::Keyword& kw) -> ir::UnnamedAddr;
auto ResolveOptionalUnnamedAddr(const std::optional<ast::Keyword>& kw)
    -> ir::UnnamedAddr;

// Model keyword inside `thread_local(...)`.
auto ResolveTlsModel(const ast::Keyword& kw) -> ir::TlsModel;

// Absent marker -> kNone, bare `thread_local` -> kGeneralDynamic,
// `thread_local(model)` -> model.
auto ResolveThreadLocal(const std::optional<ast::ThreadLocal>& node)
    -> ir::TlsModel;

auto ResolveSelectionKind(const ast::Keyword& kw) -> ir::SelectionKind;

// `$c = comdat` without a kind selects `any`.
auto ResolveOptionalSelectionKind(const std::optional<ast::Keyword>& kw)
    -> ir::SelectionKind;

// Named keywords resolve through the keyword table. `cc N` resolves through
// the numeric table; codes outside it are reported as unsupported with
// DiagCode::kUnsupportedCallingConvention.
auto ResolveCallingConv(const ast::CallingConv& node)
    -> Result<ir::CallingConv>;
auto ResolveOptionalCallingConv(const std::optional<ast::CallingConv>& node)
    -> Result<ir::CallingConv>;

auto ResolveAtomicOrdering(const ast::Keyword& kw) -> ir::AtomicOrdering;
auto ResolveAtomicOp(const ast::Keyword& kw) -> ir::AtomicOp;
auto ResolveIPred(const ast::Keyword& kw) -> ir::IPred;
auto ResolveFPred(const ast::Keyword& kw) -> ir::FPred;

auto ResolveTail(const ast::Keyword& kw) -> ir::Tail;
auto ResolveOptionalTail(const std::optional<ast::Keyword>& kw) -> ir::Tail;

auto ResolveFastMathFlag(const ast::Keyword& kw) -> ir::FastMathFlag;
auto ResolveOverflowFlag(const ast::Keyword& kw) -> ir::OverflowFlag;

// Flag lists; repeated flags are idempotent.
auto ResolveFastMathFlags(std::span<const ast::Keyword> kws)
    -> ir::FastMathFlags;
auto ResolveOverflowFlags(std::span<const ast::Keyword> kws)
    -> ir::OverflowFlags;

auto ResolveImmutable(const ast::Keyword& kw) -> ir::Immutable;
auto ResolveBinaryOpcode(const ast::Keyword& kw) -> ir::BinaryOpcode;

}  // namespace llasm::lowering::ast_to_ir

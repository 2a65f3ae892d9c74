#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/internal_error.hpp"
#include "llasm/ir/enum_table.hpp"
#include "llasm/ir/enums.hpp"
#include "llasm/lowering/ast_to_ir/enum_resolver.hpp"
#include "tests/common/ast_builder.hpp"

namespace llasm::lowering::ast_to_ir {
namespace {

using test::Kw;
using test::Uint;

class EnumResolverTest : public ::testing::Test {
 protected:
  static auto NamedCc(std::string text) -> ast::CallingConv {
    return ast::CallingConvEnum{.keyword = Kw(std::move(text))};
  }

  static auto NumericCc(std::string code) -> ast::CallingConv {
    return ast::CallingConvInt{.code = Uint(std::move(code))};
  }
};

// =============================================================================
// Closed keyword sets
// =============================================================================

TEST_F(EnumResolverTest, EveryLinkageKeywordResolves) {
  for (const auto& row : ir::kLinkageTable) {
    EXPECT_EQ(ResolveLinkage(Kw(std::string(row.keyword))), row.value);
  }
}

TEST_F(EnumResolverTest, AbsentAttributesResolveToNone) {
  EXPECT_EQ(ResolveOptionalLinkage(std::nullopt), ir::Linkage::kNone);
  EXPECT_EQ(ResolveOptionalVisibility(std::nullopt), ir::Visibility::kNone);
  EXPECT_EQ(
      ResolveOptionalDllStorageClass(std::nullopt), ir::DllStorageClass::kNone);
  EXPECT_EQ(ResolveOptionalPreemption(std::nullopt), ir::Preemption::kNone);
  EXPECT_EQ(ResolveOptionalUnnamedAddr(std::nullopt), ir::UnnamedAddr::kNone);
  EXPECT_EQ(ResolveOptionalTail(std::nullopt), ir::Tail::kNone);
}

TEST_F(EnumResolverTest, PresentOptionalsGoThroughTheTable) {
  EXPECT_EQ(ResolveOptionalLinkage(Kw("weak_odr")), ir::Linkage::kWeakOdr);
  EXPECT_EQ(ResolveOptionalVisibility(Kw("hidden")), ir::Visibility::kHidden);
  EXPECT_EQ(
      ResolveOptionalDllStorageClass(Kw("dllimport")),
      ir::DllStorageClass::kDllImport);
  EXPECT_EQ(ResolveOptionalPreemption(Kw("dso_local")), ir::Preemption::kDsoLocal);
  EXPECT_EQ(
      ResolveOptionalUnnamedAddr(Kw("local_unnamed_addr")),
      ir::UnnamedAddr::kLocalUnnamedAddr);
  EXPECT_EQ(ResolveOptionalTail(Kw("musttail")), ir::Tail::kMustTail);
}

TEST_F(EnumResolverTest, UnknownKeywordIsInternalError) {
  EXPECT_THROW(ResolveLinkage(Kw("dllexport")), common::InternalError);
  EXPECT_THROW(ResolveVisibility(Kw("")), common::InternalError);
  EXPECT_THROW(ResolveOptionalLinkage(Kw("Internal")), common::InternalError);
  EXPECT_THROW(ResolveAtomicOrdering(Kw("relaxed")), common::InternalError);
  EXPECT_THROW(ResolveIPred(Kw("olt")), common::InternalError);
  EXPECT_THROW(ResolveFPred(Kw("slt")), common::InternalError);
  EXPECT_THROW(ResolveBinaryOpcode(Kw("fadd")), common::InternalError);
  EXPECT_THROW(ResolveCallingConv(NamedCc("cc")), common::InternalError);
}

TEST_F(EnumResolverTest, EachVocabularyRejectsForeignSpellings) {
  EXPECT_THROW(ResolveDllStorageClass(Kw("dllexpor")), common::InternalError);
  EXPECT_THROW(ResolveDllStorageClass(Kw("dso_local")), common::InternalError);
  EXPECT_THROW(ResolvePreemption(Kw("dllimport")), common::InternalError);
  EXPECT_THROW(
      ResolveOptionalPreemption(Kw("dso_preemptible")), common::InternalError);
  EXPECT_THROW(ResolveUnnamedAddr(Kw("unnamed")), common::InternalError);
  EXPECT_THROW(
      ResolveOptionalUnnamedAddr(Kw("local_unnamed")), common::InternalError);
  EXPECT_THROW(ResolveTlsModel(Kw("generaldynamic")), common::InternalError);
  EXPECT_THROW(ResolveSelectionKind(Kw("nodeduplicate")), common::InternalError);
  EXPECT_THROW(ResolveSelectionKind(Kw("exact")), common::InternalError);
  EXPECT_THROW(ResolveTail(Kw("tailcall")), common::InternalError);
  EXPECT_THROW(ResolveOptionalTail(Kw("must_tail")), common::InternalError);
  EXPECT_THROW(ResolveAtomicOp(Kw("mul")), common::InternalError);
  EXPECT_THROW(ResolveAtomicOp(Kw("fmax")), common::InternalError);
  EXPECT_THROW(ResolveFastMathFlag(Kw("fast ")), common::InternalError);
  EXPECT_THROW(ResolveFastMathFlag(Kw("nsw")), common::InternalError);
  EXPECT_THROW(ResolveOverflowFlag(Kw("exact")), common::InternalError);
  EXPECT_THROW(ResolveOverflowFlag(Kw("nnan")), common::InternalError);
  EXPECT_THROW(ResolveImmutable(Kw("const")), common::InternalError);
}

TEST_F(EnumResolverTest, SameSpellingDifferentVocabulary) {
  EXPECT_EQ(ResolveAtomicOp(Kw("add")), ir::AtomicOp::kAdd);
  EXPECT_EQ(ResolveBinaryOpcode(Kw("add")), ir::BinaryOpcode::kAdd);
  EXPECT_EQ(ResolveIPred(Kw("uge")), ir::IPred::kUge);
  EXPECT_EQ(ResolveFPred(Kw("uge")), ir::FPred::kUge);
  EXPECT_EQ(ResolveFPred(Kw("true")), ir::FPred::kTrue);
}

// =============================================================================
// Thread-local storage and comdats
// =============================================================================

TEST_F(EnumResolverTest, ThreadLocalHasThreeStates) {
  EXPECT_EQ(ResolveThreadLocal(std::nullopt), ir::TlsModel::kNone);
  EXPECT_EQ(
      ResolveThreadLocal(ast::ThreadLocal{.model = std::nullopt}),
      ir::TlsModel::kGeneralDynamic);
  EXPECT_EQ(
      ResolveThreadLocal(ast::ThreadLocal{.model = Kw("localexec")}),
      ir::TlsModel::kLocalExec);
}

TEST_F(EnumResolverTest, GeneralDynamicHasNoKeyword) {
  EXPECT_THROW(ResolveTlsModel(Kw("generaldynamic")), common::InternalError);
}

TEST_F(EnumResolverTest, ComdatSelectionDefaultsToAny) {
  EXPECT_EQ(ResolveOptionalSelectionKind(std::nullopt), ir::SelectionKind::kAny);
  EXPECT_EQ(
      ResolveOptionalSelectionKind(Kw("noduplicates")),
      ir::SelectionKind::kNoDuplicates);
}

// =============================================================================
// Calling conventions
// =============================================================================

TEST_F(EnumResolverTest, NamedCallingConventions) {
  EXPECT_EQ(ResolveCallingConv(NamedCc("fastcc")), ir::CallingConv::kFast);
  EXPECT_EQ(
      ResolveCallingConv(NamedCc("amdgpu_kernel")),
      ir::CallingConv::kAmdgpuKernel);
  EXPECT_EQ(ResolveOptionalCallingConv(std::nullopt), ir::CallingConv::kNone);
}

TEST_F(EnumResolverTest, NumericCallingConventionsFromTable) {
  EXPECT_EQ(ResolveCallingConv(NumericCc("11")), ir::CallingConv::kHiPE);
  EXPECT_EQ(ResolveCallingConv(NumericCc("86")), ir::CallingConv::kAvrBuiltin);
  EXPECT_EQ(ResolveCallingConv(NumericCc("87")), ir::CallingConv::kAmdgpuVs);
  EXPECT_EQ(ResolveCallingConv(NumericCc("88")), ir::CallingConv::kAmdgpuGs);
  EXPECT_EQ(ResolveCallingConv(NumericCc("89")), ir::CallingConv::kAmdgpuPs);
  EXPECT_EQ(ResolveCallingConv(NumericCc("90")), ir::CallingConv::kAmdgpuCs);
  EXPECT_EQ(
      ResolveCallingConv(NumericCc("91")), ir::CallingConv::kAmdgpuKernel);
  EXPECT_EQ(ResolveCallingConv(NumericCc("93")), ir::CallingConv::kAmdgpuHs);
  EXPECT_EQ(
      ResolveCallingConv(NumericCc("94")), ir::CallingConv::kMsp430Builtin);
  EXPECT_EQ(ResolveCallingConv(NumericCc("95")), ir::CallingConv::kAmdgpuLs);
  EXPECT_EQ(ResolveCallingConv(NumericCc("96")), ir::CallingConv::kAmdgpuEs);
}

TEST_F(EnumResolverTest, NumericAndNamedFormsAgree) {
  EXPECT_EQ(
      ResolveCallingConv(NumericCc("90")),
      ResolveCallingConv(NamedCc("amdgpu_cs")));
}

TEST_F(EnumResolverTest, UnknownNumericCodeIsUnsupported) {
  for (const char* code : {"0", "8", "92", "97", "1023"}) {
    auto result = ResolveCallingConv(NumericCc(code));
    ASSERT_FALSE(result) << code;
    EXPECT_TRUE(result.error().IsUnsupported());
    EXPECT_EQ(result.error().code, DiagCode::kUnsupportedCallingConvention);
    EXPECT_EQ(result.error().subject, code);
    EXPECT_EQ(
        result.error().primary.category, UnsupportedCategory::kOperation);
  }
}

// =============================================================================
// Flags
// =============================================================================

TEST_F(EnumResolverTest, FlagListsAreIdempotent) {
  std::vector<ast::Keyword> kws = {Kw("nnan"), Kw("ninf"), Kw("nnan")};
  ir::FastMathFlags flags = ResolveFastMathFlags(kws);
  EXPECT_TRUE(flags.Has(ir::FastMathFlag::kNnan));
  EXPECT_TRUE(flags.Has(ir::FastMathFlag::kNinf));
  EXPECT_FALSE(flags.Has(ir::FastMathFlag::kFast));

  std::vector<ast::Keyword> once = {Kw("nnan"), Kw("ninf")};
  EXPECT_EQ(flags, ResolveFastMathFlags(once));
}

TEST_F(EnumResolverTest, OverflowFlags) {
  std::vector<ast::Keyword> kws = {Kw("nuw"), Kw("nsw")};
  ir::OverflowFlags flags = ResolveOverflowFlags(kws);
  EXPECT_TRUE(flags.Has(ir::OverflowFlag::kNuw));
  EXPECT_TRUE(flags.Has(ir::OverflowFlag::kNsw));
  EXPECT_TRUE(ResolveOverflowFlags({}).Empty());
  std::vector<ast::Keyword> bad = {Kw("exact")};
  EXPECT_THROW(ResolveOverflowFlags(bad), common::InternalError);
}

TEST_F(EnumResolverTest, Immutable) {
  EXPECT_EQ(ResolveImmutable(Kw("global")), ir::Immutable::kGlobal);
  EXPECT_EQ(ResolveImmutable(Kw("constant")), ir::Immutable::kConstant);
}

}  // namespace
}  // namespace llasm::lowering::ast_to_ir

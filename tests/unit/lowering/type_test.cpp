#include <gtest/gtest.h>

#include <optional>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/internal_error.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/lowering/ast_to_ir/type.hpp"
#include "tests/common/ast_builder.hpp"
#include "tests/common/lowering_fixture.hpp"

namespace llasm::lowering::ast_to_ir {
namespace {

using test::PtrTy;
using test::Ty;
using test::Uint;

class TypeLoweringTest : public test::LoweringFixture {};

TEST_F(TypeLoweringTest, Scalars) {
  EXPECT_EQ(LowerType(Ty("void"), ctx_), ctx_.builtin_types.void_type);
  EXPECT_EQ(LowerType(Ty("label"), ctx_), ctx_.builtin_types.label_type);
  EXPECT_EQ(LowerType(Ty("i1"), ctx_), ctx_.builtin_types.bool_type);
  EXPECT_EQ(LowerType(Ty("ptr"), ctx_), ctx_.builtin_types.ptr_type);
  EXPECT_EQ(LowerType(Ty("i32"), ctx_), I32());
  EXPECT_EQ(
      LowerType(Ty("double"), ctx_), module_.types.Float(ir::FloatKind::kDouble));
  EXPECT_EQ(
      LowerType(Ty("half"), ctx_), module_.types.Float(ir::FloatKind::kHalf));
}

TEST_F(TypeLoweringTest, PointerAddressSpace) {
  EXPECT_EQ(LowerType(PtrTy("3"), ctx_), module_.types.Pointer(3));
  EXPECT_EQ(LowerType(PtrTy("0"), ctx_), ctx_.builtin_types.ptr_type);

  auto bad = LowerType(PtrTy("16777216"), ctx_);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, DiagCode::kConstantOutOfRange);
}

TEST_F(TypeLoweringTest, IntegerWidthBounds) {
  EXPECT_TRUE(LowerType(Ty("i8388607"), ctx_));

  for (const char* spelling : {"i0", "i8388608", "i99999999999999999999"}) {
    auto result = LowerType(Ty(spelling), ctx_);
    ASSERT_FALSE(result) << spelling;
    EXPECT_EQ(result.error().code, DiagCode::kInvalidType);
    EXPECT_EQ(result.error().primary.kind, DiagKind::kError);
  }
}

TEST_F(TypeLoweringTest, OtherSpellingsAreUnsupported) {
  for (const char* spelling : {"fp128", "x86_fp80", "<4 x i32>", "[2 x i8]"}) {
    auto result = LowerType(Ty(spelling), ctx_);
    ASSERT_FALSE(result) << spelling;
    EXPECT_TRUE(result.error().IsUnsupported());
    EXPECT_EQ(result.error().code, DiagCode::kUnsupportedType);
    EXPECT_EQ(result.error().primary.category, UnsupportedCategory::kType);
  }
}

TEST_F(TypeLoweringTest, AddressSpaceOnNonPointerIsInternalError) {
  ast::Type node = Ty("i32");
  node.addr_space = Uint("1");
  EXPECT_THROW((void)LowerType(node, ctx_), common::InternalError);
}

}  // namespace
}  // namespace llasm::lowering::ast_to_ir

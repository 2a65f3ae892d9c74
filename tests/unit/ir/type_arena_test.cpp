#include <gtest/gtest.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/ir/constant.hpp"
#include "llasm/ir/constant_arena.hpp"
#include "llasm/ir/module.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/ir/type_arena.hpp"

namespace llasm::ir {
namespace {

class TypeArenaTest : public ::testing::Test {
 protected:
  TypeArena arena_;
};

TEST_F(TypeArenaTest, EqualTypesShareOneId) {
  EXPECT_EQ(arena_.Integer(32), arena_.Integer(32));
  EXPECT_EQ(arena_.Pointer(), arena_.Pointer(0));
  EXPECT_NE(arena_.Integer(32), arena_.Integer(64));
  EXPECT_NE(arena_.Pointer(0), arena_.Pointer(1));
  EXPECT_NE(arena_.Float(FloatKind::kFloat), arena_.Float(FloatKind::kDouble));
  EXPECT_EQ(arena_.Size(), 6);
}

TEST_F(TypeArenaTest, Spellings) {
  EXPECT_EQ(ToString(arena_[arena_.Integer(1)]), "i1");
  EXPECT_EQ(ToString(arena_[arena_.Pointer(3)]), "ptr addrspace(3)");
  EXPECT_EQ(ToString(arena_[arena_.Pointer()]), "ptr");
  EXPECT_EQ(ToString(arena_[arena_.Float(FloatKind::kHalf)]), "half");
  EXPECT_EQ(ToString(arena_[arena_.Void()]), "void");
}

TEST_F(TypeArenaTest, WrongAccessorIsInternalError) {
  const Type& type = arena_[arena_.Integer(8)];
  EXPECT_EQ(type.AsInteger().bit_width, 8);
  EXPECT_THROW((void)type.AsPointer(), common::InternalError);
  EXPECT_THROW((void)arena_[TypeId{999}], common::InternalError);
}

TEST_F(TypeArenaTest, ConstantsInternByTypeAndValue) {
  ConstantArena constants;
  TypeId i8 = arena_.Integer(8);
  TypeId i16 = arena_.Integer(16);
  ConstId a = constants.Intern(i8, IntegerConstant{.bits = 1});
  EXPECT_EQ(a, constants.Intern(i8, IntegerConstant{.bits = 1}));
  EXPECT_NE(a, constants.Intern(i16, IntegerConstant{.bits = 1}));
  EXPECT_NE(a, constants.Intern(i8, UndefConstant{}));
  EXPECT_EQ(constants[a].type, i8);
}

TEST_F(TypeArenaTest, OperandTypeOfGlobalIsItsAddressType) {
  Module module;
  module.globals.push_back(GlobalVariable{.name = "g", .addr_space = 2});
  Function func{.name = "f"};
  TypeId type = OperandType(
      module, func, GlobalRef{.kind = GlobalKind::kVariable, .index = 0});
  EXPECT_EQ(type, module.types.Pointer(2));
}

}  // namespace
}  // namespace llasm::ir

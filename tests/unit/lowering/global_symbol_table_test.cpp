#include <gtest/gtest.h>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/lowering/ast_to_ir/global_symbol_table.hpp"
#include "tests/common/ast_builder.hpp"

namespace llasm::lowering::ast_to_ir {
namespace {

using test::NextSpan;

class GlobalSymbolTableTest : public ::testing::Test {
 protected:
  GlobalSymbolTable table_;
};

TEST_F(GlobalSymbolTableTest, VariablesAndFunctionsShareNamespace) {
  ir::GlobalRef var{.kind = ir::GlobalKind::kVariable, .index = 0};
  ir::GlobalRef func{.kind = ir::GlobalKind::kFunction, .index = 0};
  ASSERT_TRUE(table_.Declare("g", var, NextSpan()));
  ASSERT_TRUE(table_.Declare("f", func, NextSpan()));

  auto redefined = table_.Declare("g", func, NextSpan());
  ASSERT_FALSE(redefined);
  EXPECT_EQ(redefined.error().code, DiagCode::kRedefinition);
  EXPECT_EQ(
      redefined.error().primary.message,
      "redefinition of global identifier '@g'");

  EXPECT_EQ(table_.Resolve("g", NextSpan()), var);
  EXPECT_EQ(table_.Resolve("f", NextSpan()), func);
  EXPECT_EQ(table_.Size(), 2);
}

TEST_F(GlobalSymbolTableTest, ComdatsHaveTheirOwnNamespace) {
  ASSERT_TRUE(table_.Declare(
      "c", ir::GlobalRef{.kind = ir::GlobalKind::kVariable, .index = 0},
      NextSpan()));
  ASSERT_TRUE(table_.DeclareComdat("c", ir::ComdatId{0}, NextSpan()));
  EXPECT_EQ(table_.ResolveComdat("c", NextSpan()), ir::ComdatId{0});
  EXPECT_FALSE(table_.DeclareComdat("c", ir::ComdatId{1}, NextSpan()));
  EXPECT_EQ(table_.ComdatCount(), 1);
}

TEST_F(GlobalSymbolTableTest, UnknownNamesAreUnresolved) {
  auto global = table_.Resolve("missing", NextSpan());
  ASSERT_FALSE(global);
  EXPECT_EQ(global.error().code, DiagCode::kUnresolvedName);
  EXPECT_EQ(
      global.error().primary.message,
      "unable to locate global identifier '@missing'");

  auto comdat = table_.ResolveComdat("missing", NextSpan());
  ASSERT_FALSE(comdat);
  EXPECT_EQ(comdat.error().code, DiagCode::kUnresolvedName);
}

}  // namespace
}  // namespace llasm::lowering::ast_to_ir

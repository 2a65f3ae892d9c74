#include <gtest/gtest.h>

#include <variant>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/internal_error.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/value.hpp"
#include "llasm/lowering/ast_to_ir/local_symbol_table.hpp"
#include "tests/common/ast_builder.hpp"

namespace llasm::lowering::ast_to_ir {
namespace {

using test::NextSpan;

class LocalSymbolTableTest : public ::testing::Test {
 protected:
  static auto Value(ir::InstId id) -> LocalSymbol {
    return LocalSymbol{.entity = id, .definition = NextSpan()};
  }

  static auto Block(ir::BlockId id) -> LocalSymbol {
    return LocalSymbol{.entity = id, .definition = NextSpan()};
  }

  LocalSymbolTable table_;
};

TEST_F(LocalSymbolTableTest, ResolvesDeclaredNames) {
  ASSERT_TRUE(table_.Declare("x", Value(ir::InstId{3})));
  ASSERT_TRUE(table_.Declare("entry", Block(ir::BlockId{0})));
  ASSERT_TRUE(
      table_.Declare("p", LocalSymbol{.entity = ir::ArgId{1}, .definition = {}}));
  table_.Seal();

  auto x = table_.ResolveValue("x", NextSpan());
  ASSERT_TRUE(x);
  EXPECT_EQ(std::get<ir::InstId>(*x), ir::InstId{3});

  auto p = table_.ResolveValue("p", NextSpan());
  ASSERT_TRUE(p);
  EXPECT_EQ(std::get<ir::ArgId>(*p), ir::ArgId{1});

  auto entry = table_.ResolveBlock("entry", NextSpan());
  ASSERT_TRUE(entry);
  EXPECT_EQ(*entry, ir::BlockId{0});
  EXPECT_EQ(table_.Size(), 3);
}

TEST_F(LocalSymbolTableTest, UnknownNameIsUnresolved) {
  table_.Seal();
  auto use = NextSpan();
  auto result = table_.ResolveBlock("nowhere", use);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, DiagCode::kUnresolvedName);
  EXPECT_EQ(result.error().subject, "nowhere");
  EXPECT_EQ(result.error().primary.span, DiagSpan(use));
  EXPECT_EQ(
      result.error().primary.message,
      "unable to locate local identifier '%nowhere'");
}

TEST_F(LocalSymbolTableTest, LookupBeforeDeclarationIsUnresolved) {
  // Not sealed yet: the name has simply not been declared.
  auto result = table_.ResolveValue("later", NextSpan());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, DiagCode::kUnresolvedName);
}

TEST_F(LocalSymbolTableTest, ValueUsedAsBlockIsKindMismatch) {
  LocalSymbol symbol = Value(ir::InstId{0});
  ASSERT_TRUE(table_.Declare("v", symbol));
  table_.Seal();

  auto result = table_.ResolveBlock("v", NextSpan());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, DiagCode::kSymbolKindMismatch);
  EXPECT_EQ(result.error().primary.message, "invalid value '%v'; expected basic block");
  ASSERT_EQ(result.error().notes.size(), 1);
  EXPECT_EQ(result.error().notes[0].span, DiagSpan(symbol.definition));
}

TEST_F(LocalSymbolTableTest, BlockUsedAsValueIsKindMismatch) {
  ASSERT_TRUE(table_.Declare("bb", Block(ir::BlockId{2})));
  auto result = table_.ResolveValue("bb", NextSpan());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, DiagCode::kSymbolKindMismatch);
}

TEST_F(LocalSymbolTableTest, ValuesAndBlocksShareOneNamespace) {
  LocalSymbol first = Value(ir::InstId{0});
  ASSERT_TRUE(table_.Declare("x", first));
  auto result = table_.Declare("x", Block(ir::BlockId{0}));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, DiagCode::kRedefinition);
  ASSERT_EQ(result.error().notes.size(), 1);
  EXPECT_EQ(result.error().notes[0].message, "previous definition is here");
  EXPECT_EQ(result.error().notes[0].span, DiagSpan(first.definition));

  // The first definition wins.
  EXPECT_EQ(
      std::get<ir::InstId>(table_.Lookup("x")->entity), ir::InstId{0});
}

TEST_F(LocalSymbolTableTest, EmptyNameIsAName) {
  ASSERT_TRUE(table_.Declare("", Value(ir::InstId{0})));
  EXPECT_NE(table_.Lookup(""), nullptr);
  EXPECT_EQ(table_.Lookup("0"), nullptr);
}

TEST_F(LocalSymbolTableTest, DeclareAfterSealIsInternalError) {
  table_.Seal();
  EXPECT_TRUE(table_.IsSealed());
  EXPECT_THROW(
      (void)table_.Declare("late", Value(ir::InstId{0})),
      common::InternalError);
}

}  // namespace
}  // namespace llasm::lowering::ast_to_ir

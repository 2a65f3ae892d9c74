#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/diagnostic/diagnostic_sink.hpp"
#include "llasm/common/internal_error.hpp"
#include "llasm/ir/constant.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/module.hpp"
#include "llasm/lowering/ast_to_ir/lower.hpp"
#include "llasm/lowering/ast_to_ir/module_lowerer.hpp"
#include "llasm/lowering/ast_to_ir/options.hpp"
#include "tests/common/ast_builder.hpp"

namespace llasm::lowering::ast_to_ir {
namespace {

using test::Block;
using test::Call;
using test::Comdat;
using test::ComdatName;
using test::Define;
using test::Float;
using test::GlobalValue;
using test::GlobalVar;
using test::Header;
using test::Int;
using test::Kw;
using test::LocalValue;
using test::Named;
using test::NextSpan;
using test::Param;
using test::Ret;
using test::RetVoid;
using test::Str;
using test::Typed;

// define <ret> @name() { entry: ret <ret> <value> }
auto Returning(std::string name, std::string type, ast::Value value)
    -> ast::Function {
  return Define(
      Header(type, std::move(name), {}),
      {Block("entry:", {}, Ret(type, std::move(value)))});
}

auto BareComdat() -> ast::ComdatRef {
  return ast::ComdatRef{.name = std::nullopt, .span = NextSpan()};
}

auto NamedComdat(std::string name) -> ast::ComdatRef {
  return ast::ComdatRef{.name = ComdatName(std::move(name)), .span = NextSpan()};
}

class ModuleLowererTest : public ::testing::Test {
 protected:
  auto Lower(const LoweringOptions& options = {}) -> ir::Module {
    return LowerAstToIr(module_, sink_, options);
  }

  void Add(ast::TopLevelEntity entity) {
    module_.entities.push_back(std::move(entity));
  }

  auto Codes() const -> std::vector<DiagCode> {
    std::vector<DiagCode> codes;
    for (const auto& diag : sink_.GetDiagnostics()) {
      codes.push_back(diag.code);
    }
    return codes;
  }

  ast::Module module_;
  DiagnosticSink sink_;
};

// =============================================================================
// Name resolution across entities
// =============================================================================

TEST_F(ModuleLowererTest, ForwardReferencesBetweenEntities) {
  // @p = global ptr @g
  // define i32 @f() { entry: %r = call i32 @h() ret i32 %r }
  // @g = global i32 0
  // define i32 @h() { entry: ret i32 1 }
  Add(GlobalVar("@p", "ptr", GlobalValue("@g")));
  Add(Define(
      Header("i32", "@f", {}),
      {Block(
          "entry:", {Named("%r", Call("i32", "@h", {}))},
          Ret("i32", LocalValue("%r")))}));
  Add(GlobalVar("@g", "i32", Int("0")));
  Add(Returning("@h", "i32", Int("1")));

  ir::Module ir = Lower();
  ASSERT_FALSE(sink_.HasErrors());
  ASSERT_EQ(ir.globals.size(), 2);
  ASSERT_EQ(ir.functions.size(), 2);

  ASSERT_TRUE(ir.globals[0].init.has_value());
  const auto& init = ir.constants[*ir.globals[0].init];
  EXPECT_EQ(
      std::get<ir::GlobalAddressConstant>(init.value).global,
      (ir::GlobalRef{.kind = ir::GlobalKind::kVariable, .index = 1}));
  EXPECT_EQ(ir.functions[1].name, "h");
  EXPECT_FALSE(ir.functions[0].IsDeclaration());
}

TEST_F(ModuleLowererTest, GlobalsAndFunctionsShareNamespace) {
  Add(GlobalVar("@x", "i32", Int("0")));
  Add(Returning("@x", "i32", Int("1")));

  ir::Module ir = Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  const Diagnostic& diag = sink_.GetDiagnostics()[0];
  EXPECT_EQ(diag.code, DiagCode::kRedefinition);
  EXPECT_EQ(diag.primary.message, "redefinition of global identifier '@x'");
  EXPECT_EQ(ir.globals.size(), 1);
  EXPECT_TRUE(ir.functions.empty());
}

TEST_F(ModuleLowererTest, UnresolvedGlobalInInitializer) {
  Add(GlobalVar("@p", "ptr", GlobalValue("@nowhere")));

  (void)Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  const Diagnostic& diag = sink_.GetDiagnostics()[0];
  EXPECT_EQ(diag.code, DiagCode::kUnresolvedName);
  ASSERT_EQ(diag.notes.size(), 1);
  EXPECT_EQ(diag.notes[0].message, "in initializer of '@p'");
}

TEST_F(ModuleLowererTest, BrokenHeaderDoesNotCascadeIntoCallers) {
  // define i32 @bad(fp128) is unsupported; the call to it still resolves.
  Add(Define(
      Header("i32", "@bad", {Param("fp128")}),
      {Block("entry:", {}, Ret("i32", Int("0")))}));
  Add(Define(
      Header("void", "@user", {}),
      {Block("entry:", {Call("i32", "@bad", {Typed("i32", Int("1"))})}, RetVoid())}));

  ir::Module ir = Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  EXPECT_EQ(sink_.GetDiagnostics()[0].code, DiagCode::kUnsupportedType);
  EXPECT_TRUE(ir.functions[0].IsDeclaration());
  EXPECT_FALSE(ir.functions[1].IsDeclaration());
}

// =============================================================================
// Comdats
// =============================================================================

TEST_F(ModuleLowererTest, BareComdatTakesOwnerName) {
  auto f = Returning("@f", "i32", Int("0"));
  f.header.comdat = BareComdat();
  Add(std::move(f));
  Add(Comdat("$f", "noduplicates"));

  ir::Module ir = Lower();
  ASSERT_FALSE(sink_.HasErrors());
  ASSERT_EQ(ir.comdats.size(), 1);
  EXPECT_EQ(ir.comdats[0].selection_kind, ir::SelectionKind::kNoDuplicates);
  EXPECT_EQ(ir.functions[0].comdat, ir::ComdatId{0});
}

TEST_F(ModuleLowererTest, NamedComdatReference) {
  Add(Comdat("$c"));
  auto g = GlobalVar("@g", "i32", Int("0"));
  g.comdat = NamedComdat("$c");
  Add(std::move(g));

  ir::Module ir = Lower();
  ASSERT_FALSE(sink_.HasErrors());
  EXPECT_EQ(ir.comdats[0].selection_kind, ir::SelectionKind::kAny);
  EXPECT_EQ(ir.globals[0].comdat, ir::ComdatId{0});
}

TEST_F(ModuleLowererTest, UnresolvedComdat) {
  auto g = GlobalVar("@g", "i32", Int("0"));
  g.comdat = BareComdat();
  Add(std::move(g));

  (void)Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  EXPECT_EQ(sink_.GetDiagnostics()[0].code, DiagCode::kUnresolvedName);
  EXPECT_EQ(sink_.GetDiagnostics()[0].subject, "g");
}

TEST_F(ModuleLowererTest, DuplicateComdat) {
  Add(Comdat("$c"));
  Add(Comdat("$c", "largest"));

  ir::Module ir = Lower();
  EXPECT_EQ(Codes(), std::vector<DiagCode>{DiagCode::kRedefinition});
  EXPECT_EQ(ir.comdats.size(), 1);
}

// =============================================================================
// Global variables
// =============================================================================

TEST_F(ModuleLowererTest, DeclarationNeedsExternalLinkage) {
  auto internal = GlobalVar("@a", "i32", std::nullopt);
  internal.linkage = Kw("internal");
  auto weak = GlobalVar("@b", "i32", std::nullopt);
  weak.linkage = Kw("extern_weak");
  Add(std::move(internal));
  Add(std::move(weak));
  Add(GlobalVar("@c", "i32", std::nullopt));

  ir::Module ir = Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  const Diagnostic& diag = sink_.GetDiagnostics()[0];
  EXPECT_EQ(diag.code, DiagCode::kInvalidOperand);
  EXPECT_EQ(
      diag.primary.message,
      "invalid linkage 'internal' for global declaration '@a'");
  EXPECT_EQ(ir.globals[1].linkage, ir::Linkage::kExternWeak);
  EXPECT_FALSE(ir.globals[2].init.has_value());
}

TEST_F(ModuleLowererTest, InitializerMustFitContentType) {
  Add(GlobalVar("@g", "i8", Int("300")));

  (void)Lower();
  ASSERT_EQ(sink_.ErrorCount(), 1);
  const Diagnostic& diag = sink_.GetDiagnostics()[0];
  EXPECT_EQ(diag.code, DiagCode::kConstantOutOfRange);
  ASSERT_EQ(diag.notes.size(), 1);
  EXPECT_EQ(diag.notes[0].message, "in initializer of '@g'");
}

TEST_F(ModuleLowererTest, ContentTypeMustBeFirstClass) {
  Add(GlobalVar("@g", "void", std::nullopt));

  (void)Lower();
  EXPECT_EQ(Codes(), std::vector<DiagCode>{DiagCode::kInvalidType});
}

TEST_F(ModuleLowererTest, SourceFilenameIsDecoded) {
  module_.source_filename = Str("\"dir\\5Ca.ll\"");
  ir::Module ir = Lower();
  EXPECT_EQ(ir.source_filename, "dir\\a.ll");
}

// =============================================================================
// Error policy
// =============================================================================

class ErrorPolicyTest : public ModuleLowererTest {
 protected:
  void SetUp() override {
    Add(GlobalVar("@a", "i8", Int("256")));
    Add(GlobalVar("@b", "half", Float("65505.0")));
    Add(Returning("@ok", "i32", Int("0")));
  }
};

TEST_F(ErrorPolicyTest, KeepGoingReportsEveryEntity) {
  ir::Module ir = Lower();
  EXPECT_EQ(sink_.ErrorCount(), 2);
  EXPECT_FALSE(ir.functions[0].IsDeclaration());
}

TEST_F(ErrorPolicyTest, StopAtFirstFailure) {
  ir::Module ir = Lower(LoweringOptions{.max_errors = 0, .keep_going = false});
  EXPECT_EQ(sink_.ErrorCount(), 1);
  EXPECT_TRUE(ir.functions[0].IsDeclaration());
}

TEST_F(ErrorPolicyTest, MaxErrors) {
  (void)Lower(LoweringOptions{.max_errors = 1, .keep_going = true});
  EXPECT_EQ(sink_.ErrorCount(), 1);
}

TEST_F(ErrorPolicyTest, StopDuringDeclarationSkipsDefinitions) {
  Add(Returning("@ok", "i32", Int("1")));
  ir::Module ir = Lower(LoweringOptions{.max_errors = 0, .keep_going = false});
  EXPECT_EQ(Codes(), std::vector<DiagCode>{DiagCode::kRedefinition});
  EXPECT_FALSE(ir.globals[0].init.has_value());
  EXPECT_TRUE(ir.functions[0].IsDeclaration());
}

TEST_F(ModuleLowererTest, LowerIsOneShot) {
  ModuleLowerer lowerer(module_, sink_, LoweringOptions{});
  (void)lowerer.Lower();
  EXPECT_THROW((void)lowerer.Lower(), common::InternalError);
}

}  // namespace
}  // namespace llasm::lowering::ast_to_ir

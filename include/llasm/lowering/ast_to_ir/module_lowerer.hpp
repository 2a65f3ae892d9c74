#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/diagnostic/diagnostic_sink.hpp"
#include "llasm/ir/module.hpp"
#include "llasm/lowering/ast_to_ir/constant.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"
#include "llasm/lowering/ast_to_ir/global_symbol_table.hpp"
#include "llasm/lowering/ast_to_ir/options.hpp"

namespace llasm::lowering::ast_to_ir {

/// Drives lowering of one module.
///
/// Pass 1 lowers comdat definitions, then every global variable and
/// function header in source order, registering each `@name` in the global
/// table. Pass 2 lowers global initializers and function bodies, each body
/// through its own FunctionLowerer.
///
/// Every top-level entity is one failure unit: its first diagnostic is
/// reported to the sink and lowering moves on to the next entity, subject
/// to LoweringOptions.
class ModuleLowerer {
 public:
  ModuleLowerer(
      const ast::Module& node, DiagnosticSink& sink,
      const LoweringOptions& options);

  ModuleLowerer(const ModuleLowerer&) = delete;
  ModuleLowerer(ModuleLowerer&&) = delete;
  auto operator=(const ModuleLowerer&) -> ModuleLowerer& = delete;
  auto operator=(ModuleLowerer&&) -> ModuleLowerer& = delete;
  ~ModuleLowerer() = default;

  /// Runs both passes and hands over the module. Callable once.
  auto Lower() -> ir::Module;

 private:
  void DeclareEntities();
  void LowerDefinitions();

  auto LowerComdat(const ast::ComdatDef& node) -> Result<void>;
  auto DeclareGlobal(const ast::GlobalDecl& node, size_t entity)
      -> Result<void>;
  auto DeclareFunction(const ast::Function& node, size_t entity)
      -> Result<void>;
  auto LowerGlobalInit(const ast::GlobalDecl& node, uint32_t index)
      -> Result<void>;

  // `comdat` / `comdat($name)`; a bare reference names the comdat after the
  // entity itself.
  auto LowerComdatRef(
      const std::optional<ast::ComdatRef>& node, const std::string& owner)
      -> Result<std::optional<ir::ComdatId>>;

  // Reports `diag`; sets stopped_ when the error policy says to stop.
  void Fail(Diagnostic diag);

  const ast::Module& node_;
  DiagnosticSink& sink_;
  LoweringOptions options_;

  ir::Module module_;
  GlobalSymbolTable globals_;
  DefaultConstantLowerer constant_lowerer_;
  Context ctx_;

  // Module index of each top-level entity whose header lowered cleanly;
  // pass 2 skips the rest.
  std::vector<std::optional<uint32_t>> entity_index_;
  size_t error_count_ = 0;
  bool stopped_ = false;
  bool lowered_ = false;
};

}  // namespace llasm::lowering::ast_to_ir

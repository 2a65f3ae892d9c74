#include "llasm/lowering/ast_to_ir/lower.hpp"

#include "llasm/lowering/ast_to_ir/module_lowerer.hpp"

namespace llasm::lowering::ast_to_ir {

auto LowerAstToIr(
    const ast::Module& module, DiagnosticSink& sink,
    const LoweringOptions& options) -> ir::Module {
  ModuleLowerer lowerer(module, sink, options);
  return lowerer.Lower();
}

}  // namespace llasm::lowering::ast_to_ir

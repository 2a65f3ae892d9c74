#pragma once

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic_sink.hpp"
#include "llasm/ir/module.hpp"
#include "llasm/lowering/ast_to_ir/options.hpp"

namespace llasm::lowering::ast_to_ir {

// Lowers a parsed module. Semantic failures go to `sink`; the returned module
// is complete only if the sink reports no errors. InternalError propagates
// to the caller.
auto LowerAstToIr(
    const ast::Module& module, DiagnosticSink& sink,
    const LoweringOptions& options = {}) -> ir::Module;

}  // namespace llasm::lowering::ast_to_ir

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/ir/function.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/lowering/ast_to_ir/context.hpp"
#include "llasm/lowering/ast_to_ir/local_symbol_table.hpp"

namespace llasm::lowering::ast_to_ir {

// Lowers one function body into `func`, whose header (return type, parameter
// types) must already be lowered.
//
// Pass 1 (DeclareLocals) declares every parameter, basic block and named
// instruction result, reserving instruction slots with their result types,
// then seals the symbol table. Pass 2 (LowerBodies) lowers instruction
// operands and terminators against the sealed table, so a phi may name a
// block that appears later in the function.
//
// Unnamed parameters, blocks and non-void results take the next implicit
// number (`%0`, `%1`, ...); an explicit numeric name must equal that number.
//
// The symbol table lives and dies with this object; it is never shared
// between functions.
class FunctionLowerer {
 public:
  FunctionLowerer(Context* ctx, const ast::Function& node, ir::Function* func);

  auto DeclareLocals() -> Result<void>;

  // Throws InternalError if DeclareLocals() has not completed.
  auto LowerBodies() -> Result<void>;

  // Both passes; stops at the first failure.
  auto Lower() -> Result<void>;

  [[nodiscard]] auto Symbols() const -> const LocalSymbolTable& {
    return locals_;
  }

  [[nodiscard]] auto Scope() -> FunctionScope {
    return FunctionScope{.ctx = ctx_, .func = func_, .locals = &locals_};
  }

 private:
  // `raw` is the identifier as spelled; `name` is its decoded text.
  auto DeclareLocal(
      const std::optional<ast::RawIdentifier>& raw,
      const std::optional<std::string>& name, LocalEntity entity,
      SourceSpan span) -> Result<void>;

  Context* ctx_;
  const ast::Function& node_;
  ir::Function* func_;
  LocalSymbolTable locals_;
  uint32_t next_local_id_ = 0;
  // Slots reserved in pass 1, in source order.
  std::vector<ir::BlockId> block_ids_;
  std::vector<ir::InstId> inst_ids_;
};

}  // namespace llasm::lowering::ast_to_ir

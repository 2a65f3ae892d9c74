#pragma once

#include "llasm/ir/function.hpp"
#include "llasm/ir/module.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/ir/type_arena.hpp"
#include "llasm/lowering/ast_to_ir/global_symbol_table.hpp"
#include "llasm/lowering/ast_to_ir/local_symbol_table.hpp"

namespace llasm::lowering::ast_to_ir {

class ConstantLowerer;

/// Canonical types used across lowering.
/// Initialized once per module via InternBuiltinTypes().
struct BuiltinTypes {
  ir::TypeId void_type;
  ir::TypeId label_type;
  /// Result type of icmp/fcmp and operand type of conditional branches.
  ir::TypeId bool_type;
  /// `ptr` in address space 0; operand type of call targets.
  ir::TypeId ptr_type;
};

inline auto InternBuiltinTypes(ir::TypeArena& arena) -> BuiltinTypes {
  return BuiltinTypes{
      .void_type = arena.Void(),
      .label_type = arena.Label(),
      .bool_type = arena.Integer(1),
      .ptr_type = arena.Pointer(0),
  };
}

// Module-scope lowering state, shared by every function lowering of one
// module. The global table is read-only once module pass 1 is done.
struct Context {
  ir::Module* module = nullptr;
  const GlobalSymbolTable* globals = nullptr;
  ConstantLowerer* constant_lowerer = nullptr;

  BuiltinTypes builtin_types{};

  [[nodiscard]] auto Types() const -> ir::TypeArena& {
    return module->types;
  }
};

// State of one function lowering. `locals` belongs to that lowering alone
// and is discarded with it.
struct FunctionScope {
  Context* ctx = nullptr;
  ir::Function* func = nullptr;
  const LocalSymbolTable* locals = nullptr;
};

}  // namespace llasm::lowering::ast_to_ir

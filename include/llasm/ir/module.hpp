#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llasm/common/internal_error.hpp"
#include "llasm/ir/constant_arena.hpp"
#include "llasm/ir/enums.hpp"
#include "llasm/ir/function.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/type_arena.hpp"
#include "llasm/ir/value.hpp"

namespace llasm::ir {

struct Comdat {
  std::string name;
  SelectionKind selection_kind = SelectionKind::kAny;
};

struct GlobalVariable {
  std::string name;
  Linkage linkage = Linkage::kNone;
  Preemption preemption = Preemption::kNone;
  Visibility visibility = Visibility::kNone;
  DllStorageClass dll_storage_class = DllStorageClass::kNone;
  TlsModel tls_model = TlsModel::kNone;
  UnnamedAddr unnamed_addr = UnnamedAddr::kNone;
  uint32_t addr_space = 0;
  bool externally_initialized = false;
  Immutable immutable = Immutable::kGlobal;
  TypeId content_type;
  std::optional<ConstId> init;
  std::optional<std::string> section;
  std::optional<ComdatId> comdat;
  std::optional<uint64_t> align;
};

// Fully resolved program. Owns the type and constant arenas that every
// TypeId / ConstId inside it refers to.
class Module final {
 public:
  Module() = default;
  ~Module() = default;

  Module(const Module&) = delete;
  auto operator=(const Module&) -> Module& = delete;

  Module(Module&&) = default;
  auto operator=(Module&&) -> Module& = default;

  std::string source_filename;
  TypeArena types;
  ConstantArena constants;
  std::vector<Comdat> comdats;
  std::vector<GlobalVariable> globals;
  std::vector<Function> functions;

  [[nodiscard]] auto Global(GlobalRef ref) const -> const GlobalVariable& {
    if (ref.kind != GlobalKind::kVariable || ref.index >= globals.size()) {
      common::ThrowInternalError(
          "Module::Global", "reference is not a global variable");
    }
    return globals[ref.index];
  }

  [[nodiscard]] auto Func(GlobalRef ref) const -> const Function& {
    if (ref.kind != GlobalKind::kFunction || ref.index >= functions.size()) {
      common::ThrowInternalError(
          "Module::Func", "reference is not a function");
    }
    return functions[ref.index];
  }

  // Type of the address of a global: `ptr addrspace(N)`.
  auto AddressType(GlobalRef ref) -> TypeId {
    uint32_t addr_space = ref.kind == GlobalKind::kVariable
                              ? Global(ref).addr_space
                              : Func(ref).addr_space;
    return types.Pointer(addr_space);
  }
};

// Type of an operand used inside `func`.
auto OperandType(Module& module, const Function& func, const Operand& operand)
    -> TypeId;

}  // namespace llasm::ir

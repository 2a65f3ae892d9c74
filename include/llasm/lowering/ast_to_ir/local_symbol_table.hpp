#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "absl/container/flat_hash_map.h"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/source_span.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/value.hpp"

namespace llasm::lowering::ast_to_ir {

enum class EntityKind : uint8_t {
  kValue,       // parameter or instruction result
  kBasicBlock,
};

auto ToString(EntityKind kind) -> const char*;

using LocalEntity = std::variant<ir::ArgId, ir::InstId, ir::BlockId>;

struct LocalSymbol {
  LocalEntity entity;
  SourceSpan definition;

  [[nodiscard]] auto Kind() const -> EntityKind {
    return std::holds_alternative<ir::BlockId>(entity)
               ? EntityKind::kBasicBlock
               : EntityKind::kValue;
  }
};

// Function-scope name environment (`%name`, `name:`). Values and basic
// blocks share one namespace.
//
// Two phases: the function lowerer declares every forward-referenceable
// name, then seals the table; from then on the table is read-only. Lookups
// are legal in either phase, so a name used before its declaration was
// registered reports kUnresolvedName.
class LocalSymbolTable {
 public:
  // kRedefinition if `name` is already declared. Declaring into a sealed
  // table throws InternalError.
  auto Declare(std::string name, LocalSymbol symbol) -> Result<void>;

  void Seal() {
    sealed_ = true;
  }

  [[nodiscard]] auto IsSealed() const -> bool {
    return sealed_;
  }

  // nullptr if not declared.
  [[nodiscard]] auto Lookup(std::string_view name) const -> const LocalSymbol*;

  // `name` must be declared and denote a basic block.
  [[nodiscard]] auto ResolveBlock(std::string_view name, SourceSpan use) const
      -> Result<ir::BlockId>;

  // `name` must be declared and denote a parameter or instruction result.
  [[nodiscard]] auto ResolveValue(std::string_view name, SourceSpan use) const
      -> Result<ir::Operand>;

  [[nodiscard]] auto Size() const -> size_t {
    return symbols_.size();
  }

 private:
  [[nodiscard]] auto Resolve(
      std::string_view name, SourceSpan use, EntityKind want) const
      -> Result<const LocalSymbol*>;

  absl::flat_hash_map<std::string, LocalSymbol> symbols_;
  bool sealed_ = false;
};

}  // namespace llasm::lowering::ast_to_ir

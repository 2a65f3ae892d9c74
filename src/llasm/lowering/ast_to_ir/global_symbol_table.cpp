#include "llasm/lowering/ast_to_ir/global_symbol_table.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace llasm::lowering::ast_to_ir {

auto GlobalSymbolTable::Declare(
    std::string name, ir::GlobalRef ref, SourceSpan definition)
    -> Result<void> {
  auto it = globals_.find(name);
  if (it != globals_.end()) {
    return std::unexpected(
        Diagnostic::Error(
            definition,
            fmt::format("redefinition of global identifier '@{}'", name))
            .WithNote(it->second.definition, "previous definition is here")
            .WithCode(DiagCode::kRedefinition, name));
  }
  globals_.emplace(
      std::move(name), Entry<ir::GlobalRef>{.id = ref, .definition = definition});
  return {};
}

auto GlobalSymbolTable::DeclareComdat(
    std::string name, ir::ComdatId id, SourceSpan definition) -> Result<void> {
  auto it = comdats_.find(name);
  if (it != comdats_.end()) {
    return std::unexpected(
        Diagnostic::Error(
            definition, fmt::format("redefinition of comdat '${}'", name))
            .WithNote(it->second.definition, "previous definition is here")
            .WithCode(DiagCode::kRedefinition, name));
  }
  comdats_.emplace(
      std::move(name), Entry<ir::ComdatId>{.id = id, .definition = definition});
  return {};
}

auto GlobalSymbolTable::Resolve(std::string_view name, SourceSpan use) const
    -> Result<ir::GlobalRef> {
  auto it = globals_.find(name);
  if (it == globals_.end()) {
    return std::unexpected(
        Diagnostic::Error(
            use, fmt::format("unable to locate global identifier '@{}'", name))
            .WithCode(DiagCode::kUnresolvedName, std::string(name)));
  }
  return it->second.id;
}

auto GlobalSymbolTable::ResolveComdat(
    std::string_view name, SourceSpan use) const -> Result<ir::ComdatId> {
  auto it = comdats_.find(name);
  if (it == comdats_.end()) {
    return std::unexpected(
        Diagnostic::Error(
            use, fmt::format("unable to locate comdat '${}'", name))
            .WithCode(DiagCode::kUnresolvedName, std::string(name)));
  }
  return it->second.id;
}

}  // namespace llasm::lowering::ast_to_ir

#include "llasm/lowering/ast_to_ir/local_symbol_table.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"

namespace llasm::lowering::ast_to_ir {

auto ToString(EntityKind kind) -> const char* {
  switch (kind) {
    case EntityKind::kValue:
      return "value";
    case EntityKind::kBasicBlock:
      return "basic block";
  }
  return "unknown";
}

auto LocalSymbolTable::Declare(std::string name, LocalSymbol symbol)
    -> Result<void> {
  if (sealed_) {
    throw common::InternalError(
        "LocalSymbolTable::Declare",
        fmt::format(
            "local identifier '%{}' declared after the table was sealed",
            name));
  }

  auto it = symbols_.find(name);
  if (it != symbols_.end()) {
    return std::unexpected(
        Diagnostic::Error(
            symbol.definition,
            fmt::format("redefinition of local identifier '%{}'", name))
            .WithNote(it->second.definition, "previous definition is here")
            .WithCode(DiagCode::kRedefinition, name));
  }
  symbols_.emplace(std::move(name), symbol);
  return {};
}

auto LocalSymbolTable::Lookup(std::string_view name) const
    -> const LocalSymbol* {
  auto it = symbols_.find(name);
  if (it == symbols_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto LocalSymbolTable::Resolve(
    std::string_view name, SourceSpan use, EntityKind want) const
    -> Result<const LocalSymbol*> {
  const LocalSymbol* symbol = Lookup(name);
  if (symbol == nullptr) {
    return std::unexpected(
        Diagnostic::Error(
            use, fmt::format("unable to locate local identifier '%{}'", name))
            .WithCode(DiagCode::kUnresolvedName, std::string(name)));
  }
  if (symbol->Kind() != want) {
    return std::unexpected(
        Diagnostic::Error(
            use, fmt::format(
                     "invalid {} '%{}'; expected {}", ToString(symbol->Kind()),
                     name, ToString(want)))
            .WithNote(symbol->definition, "declared here")
            .WithCode(DiagCode::kSymbolKindMismatch, std::string(name)));
  }
  return symbol;
}

auto LocalSymbolTable::ResolveBlock(std::string_view name, SourceSpan use) const
    -> Result<ir::BlockId> {
  auto symbol_or_err = Resolve(name, use, EntityKind::kBasicBlock);
  if (!symbol_or_err) return std::unexpected(symbol_or_err.error());
  return std::get<ir::BlockId>((*symbol_or_err)->entity);
}

auto LocalSymbolTable::ResolveValue(std::string_view name, SourceSpan use) const
    -> Result<ir::Operand> {
  auto symbol_or_err = Resolve(name, use, EntityKind::kValue);
  if (!symbol_or_err) return std::unexpected(symbol_or_err.error());
  return std::visit(
      Overloaded{
          [](ir::ArgId arg) -> ir::Operand { return arg; },
          [](ir::InstId inst) -> ir::Operand { return inst; },
          [](ir::BlockId /*block*/) -> ir::Operand {
            throw common::InternalError(
                "LocalSymbolTable::ResolveValue",
                "value symbol holds a block id");
          },
      },
      (*symbol_or_err)->entity);
}

}  // namespace llasm::lowering::ast_to_ir

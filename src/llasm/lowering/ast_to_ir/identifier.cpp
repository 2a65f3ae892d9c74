#include "llasm/lowering/ast_to_ir/identifier.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/string_utils.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

auto KindName(ast::IdentKind kind) -> const char* {
  switch (kind) {
    case ast::IdentKind::kGlobal:
      return "global";
    case ast::IdentKind::kLocal:
      return "local";
    case ast::IdentKind::kLabel:
      return "label";
    case ast::IdentKind::kComdat:
      return "comdat";
  }
  return "unknown";
}

void CheckKind(
    const char* context, const ast::RawIdentifier& id, ast::IdentKind want) {
  if (id.kind != want) {
    throw common::InternalError(
        context, fmt::format(
                     "expected {} identifier, got {} identifier '{}'",
                     KindName(want), KindName(id.kind), id.text));
  }
}

// Strips a one-character sigil and unquotes the rest.
auto StripPrefix(const char* context, const ast::RawIdentifier& id, char sigil)
    -> std::string {
  std::string_view text = id.text;
  if (text.empty() || text.front() != sigil) {
    throw common::InternalError(
        context,
        fmt::format(
            "invalid {} identifier '{}'; missing '{}' prefix", KindName(id.kind),
            id.text, sigil));
  }
  return common::UnquoteIfQuoted(text.substr(1));
}

}  // namespace

auto DecodeGlobal(const ast::RawIdentifier& id) -> std::string {
  CheckKind("DecodeGlobal", id, ast::IdentKind::kGlobal);
  return StripPrefix("DecodeGlobal", id, '@');
}

auto DecodeLocal(const ast::RawIdentifier& id) -> std::string {
  CheckKind("DecodeLocal", id, ast::IdentKind::kLocal);
  return StripPrefix("DecodeLocal", id, '%');
}

auto DecodeOptionalLocal(const std::optional<ast::RawIdentifier>& id)
    -> std::optional<std::string> {
  if (!id) {
    return std::nullopt;
  }
  return DecodeLocal(*id);
}

auto DecodeLabel(const ast::RawIdentifier& id) -> std::string {
  CheckKind("DecodeLabel", id, ast::IdentKind::kLabel);
  std::string_view text = id.text;
  if (text.empty() || text.back() != ':') {
    throw common::InternalError(
        "DecodeLabel",
        fmt::format("invalid label identifier '{}'; missing ':' suffix", id.text));
  }
  return common::UnquoteIfQuoted(text.substr(0, text.size() - 1));
}

auto DecodeOptionalLabel(const std::optional<ast::RawIdentifier>& id)
    -> std::optional<std::string> {
  if (!id) {
    return std::nullopt;
  }
  return DecodeLabel(*id);
}

auto DecodeComdatName(const ast::RawIdentifier& id) -> std::string {
  CheckKind("DecodeComdatName", id, ast::IdentKind::kComdat);
  return StripPrefix("DecodeComdatName", id, '$');
}

}  // namespace llasm::lowering::ast_to_ir

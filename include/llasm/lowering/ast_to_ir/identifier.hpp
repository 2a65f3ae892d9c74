#pragma once

#include <optional>
#include <string>

#include "llasm/ast/nodes.hpp"

namespace llasm::lowering::ast_to_ir {

// Name of `@name` without the '@' sigil, unquoted and unescaped.
// Throws InternalError if the identifier is not a global or lacks the sigil.
auto DecodeGlobal(const ast::RawIdentifier& id) -> std::string;

// Name of `%name` without the '%' sigil, unquoted and unescaped.
auto DecodeLocal(const ast::RawIdentifier& id) -> std::string;

// std::nullopt when no identifier node is present. `%""` decodes to an empty
// string, which is a different result.
auto DecodeOptionalLocal(const std::optional<ast::RawIdentifier>& id)
    -> std::optional<std::string>;

// Name of `name:` without the ':' terminator, unquoted and unescaped.
auto DecodeLabel(const ast::RawIdentifier& id) -> std::string;

auto DecodeOptionalLabel(const std::optional<ast::RawIdentifier>& id)
    -> std::optional<std::string>;

// Name of `$name` without the '$' sigil, unquoted and unescaped.
auto DecodeComdatName(const ast::RawIdentifier& id) -> std::string;

}  // namespace llasm::lowering::ast_to_ir

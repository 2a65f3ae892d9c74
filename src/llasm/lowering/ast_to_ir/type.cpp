#include "llasm/lowering/ast_to_ir/type.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/lowering/ast_to_ir/literal.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

auto LowerIntegerType(const ast::Type& node, Context& ctx)
    -> Result<ir::TypeId> {
  std::string_view digits = std::string_view(node.text).substr(1);
  uint64_t width = 0;
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, width, 10);
  if (ec != std::errc{} || ptr != end || width == 0 ||
      width > ir::kMaxIntegerBitWidth) {
    return std::unexpected(
        Diagnostic::Error(
            node.span, fmt::format(
                           "invalid integer type '{}'; bit width must be "
                           "between 1 and {}",
                           node.text, ir::kMaxIntegerBitWidth))
            .WithCode(DiagCode::kInvalidType, node.text));
  }
  return ctx.Types().Integer(static_cast<uint32_t>(width));
}

auto IsIntegerSpelling(std::string_view text) -> bool {
  if (text.size() < 2 || text.front() != 'i') {
    return false;
  }
  for (char c : text.substr(1)) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

auto LowerType(const ast::Type& node, Context& ctx) -> Result<ir::TypeId> {
  std::string_view text = node.text;

  if (node.addr_space && text != "ptr") {
    throw common::InternalError(
        "LowerType",
        fmt::format("address space qualifier on non-pointer type '{}'", text));
  }

  if (text == "void") {
    return ctx.Types().Void();
  }
  if (text == "label") {
    return ctx.Types().Label();
  }
  if (text == "ptr") {
    uint32_t addr_space = 0;
    if (node.addr_space) {
      auto as_or_err = DecodeAddrSpace(*node.addr_space);
      if (!as_or_err) return std::unexpected(as_or_err.error());
      addr_space = *as_or_err;
    }
    return ctx.Types().Pointer(addr_space);
  }
  if (text == "half") {
    return ctx.Types().Float(ir::FloatKind::kHalf);
  }
  if (text == "float") {
    return ctx.Types().Float(ir::FloatKind::kFloat);
  }
  if (text == "double") {
    return ctx.Types().Float(ir::FloatKind::kDouble);
  }
  if (IsIntegerSpelling(text)) {
    return LowerIntegerType(node, ctx);
  }

  return std::unexpected(
      Diagnostic::Unsupported(
          node.span,
          fmt::format("support for type '{}' not yet implemented", text),
          UnsupportedCategory::kType)
          .WithCode(DiagCode::kUnsupportedType, node.text));
}

}  // namespace llasm::lowering::ast_to_ir

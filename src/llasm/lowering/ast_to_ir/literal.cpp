#include "llasm/lowering/ast_to_ir/literal.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/string_utils.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

constexpr uint64_t kMaxAddrSpace = (uint64_t{1} << 24) - 1;
constexpr uint64_t kMaxAlignment = uint64_t{1} << 32;

auto IsValidUtf8(std::string_view s) -> bool {
  size_t i = 0;
  while (i < s.size()) {
    auto lead = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t min_code = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      min_code = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      min_code = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      min_code = 0x10000;
    } else {
      return false;
    }
    if (i + len > s.size()) {
      return false;
    }
    uint32_t code = lead & (0x7FU >> len);
    for (size_t k = 1; k < len; ++k) {
      auto cont = static_cast<unsigned char>(s[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code = (code << 6) | (cont & 0x3FU);
    }
    if (code < min_code || code > 0x10FFFF ||
        (code >= 0xD800 && code <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace

auto DecodeBool(const ast::BoolLit& lit) -> bool {
  if (lit.text == "true") {
    return true;
  }
  if (lit.text == "false") {
    return false;
  }
  throw common::InternalError(
      "DecodeBool",
      fmt::format(
          "invalid boolean literal; expected 'true' or 'false', got '{}'",
          lit.text));
}

auto DecodeUint(const ast::UintLit& lit) -> uint64_t {
  std::string_view text = lit.text;
  // from_chars accepts neither '+' nor whitespace; a leading '-' is rejected
  // explicitly since the grammar reserves it but gives it no meaning.
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    throw common::InternalError(
        "DecodeUint",
        fmt::format("unable to parse unsigned integer literal '{}'", lit.text));
  }

  uint64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value, 10);
  if (ec == std::errc::result_out_of_range) {
    throw common::InternalError(
        "DecodeUint",
        fmt::format(
            "unsigned integer literal '{}' does not fit in 64 bits", lit.text));
  }
  if (ec != std::errc{} || ptr != end) {
    throw common::InternalError(
        "DecodeUint",
        fmt::format("unable to parse unsigned integer literal '{}'", lit.text));
  }
  return value;
}

auto DecodeUintList(std::span<const ast::UintLit> lits)
    -> std::vector<uint64_t> {
  std::vector<uint64_t> values;
  values.reserve(lits.size());
  for (const auto& lit : lits) {
    values.push_back(DecodeUint(lit));
  }
  return values;
}

auto DecodeString(const ast::StringLit& lit) -> DecodedString {
  std::string_view text = lit.text;
  if (!common::IsQuoted(text)) {
    throw common::InternalError(
        "DecodeString",
        fmt::format("string literal {} is not enclosed in quotes", lit.text));
  }

  DecodedString decoded;
  decoded.text = common::Unescape(text.substr(1, text.size() - 2));
  decoded.bytes.assign(decoded.text.begin(), decoded.text.end());
  decoded.valid_utf8 = IsValidUtf8(decoded.text);
  return decoded;
}

auto DecodeAddrSpace(const ast::UintLit& n) -> Result<uint32_t> {
  uint64_t value = DecodeUint(n);
  if (value > kMaxAddrSpace) {
    return std::unexpected(
        Diagnostic::Error(
            n.span,
            fmt::format(
                "invalid address space {}; must be a 24-bit integer", value))
            .WithCode(DiagCode::kConstantOutOfRange, n.text));
  }
  return static_cast<uint32_t>(value);
}

auto DecodeOptionalAddrSpace(const std::optional<ast::AddrSpace>& node)
    -> Result<uint32_t> {
  if (!node) {
    return 0;
  }
  return DecodeAddrSpace(node->n);
}

auto DecodeAlignment(const ast::UintLit& lit) -> Result<uint64_t> {
  uint64_t n = DecodeUint(lit);
  if (n == 0 || (n & (n - 1)) != 0) {
    return std::unexpected(
        Diagnostic::Error(
            lit.span, fmt::format("alignment {} is not a power of two", n))
            .WithCode(DiagCode::kConstantOutOfRange, lit.text));
  }
  if (n > kMaxAlignment) {
    return std::unexpected(
        Diagnostic::Error(
            lit.span, fmt::format("alignment {} is larger than 2^32", n))
            .WithCode(DiagCode::kConstantOutOfRange, lit.text));
  }
  return n;
}

auto DecodeOptionalAlignment(const std::optional<ast::UintLit>& lit)
    -> Result<std::optional<uint64_t>> {
  if (!lit) {
    return std::optional<uint64_t>{};
  }
  auto align_or_err = DecodeAlignment(*lit);
  if (!align_or_err) return std::unexpected(align_or_err.error());
  return std::optional<uint64_t>{*align_or_err};
}

}  // namespace llasm::lowering::ast_to_ir

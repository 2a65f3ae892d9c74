#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "llasm/ast/nodes.hpp"
#include "llasm/common/diagnostic/diagnostic.hpp"

namespace llasm::lowering::ast_to_ir {

// Decoded string literal. String literals may hold binary blobs, so both
// views are kept: `text` is the byte string as-is and `bytes` the same
// content as raw octets. `valid_utf8` tells whether `text` is well-formed.
struct DecodedString {
  std::string text;
  std::vector<uint8_t> bytes;
  bool valid_utf8 = true;

  auto operator==(const DecodedString&) const -> bool = default;
};

// `true` or `false`; any other spelling throws InternalError.
auto DecodeBool(const ast::BoolLit& lit) -> bool;

// Base-10 unsigned 64-bit value. Empty, signed, non-digit or overflowing
// spellings throw InternalError.
auto DecodeUint(const ast::UintLit& lit) -> uint64_t;

// Decodes each literal in order.
auto DecodeUintList(std::span<const ast::UintLit> lits)
    -> std::vector<uint64_t>;

// Quoted string literal; the quotes are required.
auto DecodeString(const ast::StringLit& lit) -> DecodedString;

// The N of `addrspace(N)`; must fit in 24 bits.
auto DecodeAddrSpace(const ast::UintLit& n) -> Result<uint32_t>;

// Absent means address space 0.
auto DecodeOptionalAddrSpace(const std::optional<ast::AddrSpace>& node)
    -> Result<uint32_t>;

// `align N`; N must be a power of two no greater than 2^32.
auto DecodeAlignment(const ast::UintLit& lit) -> Result<uint64_t>;

auto DecodeOptionalAlignment(const std::optional<ast::UintLit>& lit)
    -> Result<std::optional<uint64_t>>;

// Presence-only markers such as `exact`, `volatile` or `...`.
inline auto DecodeFlag(const std::optional<ast::Keyword>& marker) -> bool {
  return marker.has_value();
}

}  // namespace llasm::lowering::ast_to_ir

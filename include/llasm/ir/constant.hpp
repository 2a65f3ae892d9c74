#pragma once

#include <bit>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "llasm/ir/ids.hpp"
#include "llasm/ir/type.hpp"

namespace llasm::ir {

// Integer constant, stored as the low `bit_width` bits of its two's
// complement value. For widths above 64, `bits` holds the low 64 bits and
// `sign_extended` says whether the bits above them are all ones.
struct IntegerConstant {
  uint64_t bits = 0;
  bool sign_extended = false;

  auto operator==(const IntegerConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const IntegerConstant& c) -> H {
    return H::combine(std::move(h), c.bits, c.sign_extended);
  }
};

// Compared and hashed by bit pattern, so -0.0 and +0.0 stay distinct and
// NaNs intern by payload.
struct FloatConstant {
  double value = 0.0;

  [[nodiscard]] auto Bits() const -> uint64_t {
    return std::bit_cast<uint64_t>(value);
  }

  auto operator==(const FloatConstant& other) const -> bool {
    return Bits() == other.Bits();
  }

  template <typename H>
  friend auto AbslHashValue(H h, const FloatConstant& c) -> H {
    return H::combine(std::move(h), c.Bits());
  }
};

struct NullConstant {
  auto operator==(const NullConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const NullConstant& /*c*/) -> H {
    return h;
  }
};

struct UndefConstant {
  auto operator==(const UndefConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const UndefConstant& /*c*/) -> H {
    return h;
  }
};

struct ZeroInitializerConstant {
  auto operator==(const ZeroInitializerConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const ZeroInitializerConstant& /*c*/) -> H {
    return h;
  }
};

// Address of a global variable or function.
struct GlobalAddressConstant {
  GlobalRef global;

  auto operator==(const GlobalAddressConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const GlobalAddressConstant& c) -> H {
    return H::combine(std::move(h), c.global);
  }
};

using ConstantValue = std::variant<
    IntegerConstant, FloatConstant, NullConstant, UndefConstant,
    ZeroInitializerConstant, GlobalAddressConstant>;

struct Constant {
  TypeId type;
  ConstantValue value;

  auto operator==(const Constant&) const -> bool = default;
};

}  // namespace llasm::ir

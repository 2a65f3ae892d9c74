#pragma once

#include <variant>

#include "llasm/ir/ids.hpp"

namespace llasm::ir {

// Operand of an instruction: a constant, a function parameter, another
// instruction's result, or the address of a module-scope entity.
using Operand = std::variant<ConstId, ArgId, InstId, GlobalRef>;

// One merge-value operand of a phi: `x` flows in from `pred`.
struct Incoming {
  Operand x;
  BlockId pred;

  auto operator==(const Incoming&) const -> bool = default;
};

// One switch arm: control transfers to `target` when the discriminant
// equals `x`.
struct Case {
  ConstId x;
  BlockId target;

  auto operator==(const Case&) const -> bool = default;
};

}  // namespace llasm::ir

#include "llasm/ir/module.hpp"

#include <variant>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"

namespace llasm::ir {

auto OperandType(Module& module, const Function& func, const Operand& operand)
    -> TypeId {
  return std::visit(
      Overloaded{
          [&](const ConstId& c) { return module.constants[c].type; },
          [&](const ArgId& a) -> TypeId {
            if (a.value >= func.params.size()) {
              throw common::InternalError(
                  "OperandType",
                  fmt::format(
                      "argument {} out of range in '{}'", a.value, func.name));
            }
            return func.params[a.value].type;
          },
          [&](const InstId& i) { return func.Inst(i).type; },
          [&](const GlobalRef& g) { return module.AddressType(g); },
      },
      operand);
}

}  // namespace llasm::ir

#pragma once

namespace llasm {

// Visitor helper for std::visit with one lambda per alternative:
//
//   std::visit(Overloaded{
//       [](const ir::ConstId& c) { ... },
//       [](const ir::InstId& i) { ... },
//   }, operand);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace llasm

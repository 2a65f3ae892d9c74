#include "llasm/ir/constant_arena.hpp"

#include <utility>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"

namespace llasm::ir {

auto ConstantArena::Intern(TypeId type, ConstantValue value) -> ConstId {
  Constant key{.type = type, .value = value};
  auto it = map_.find(key);
  if (it != map_.end()) {
    return it->second;
  }

  ConstId id{static_cast<uint32_t>(constants_.size())};
  constants_.push_back(Constant{.type = type, .value = std::move(value)});
  map_[key] = id;
  return id;
}

auto ConstantArena::operator[](ConstId id) const -> const Constant& {
  if (id.value >= constants_.size()) {
    throw common::InternalError(
        "ConstantArena", fmt::format("constant id {} out of range", id.value));
  }
  return constants_[id.value];
}

}  // namespace llasm::ir

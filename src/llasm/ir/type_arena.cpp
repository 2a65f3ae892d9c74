#include "llasm/ir/type_arena.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/ir/type.hpp"

namespace llasm::ir {

auto TypeArena::Intern(TypeKind kind, TypePayload payload) -> TypeId {
  TypeKey key{.kind = kind, .payload = payload};
  auto it = map_.find(key);
  if (it != map_.end()) {
    return it->second;
  }

  TypeId id{static_cast<uint32_t>(types_.size())};
  types_.emplace_back();
  types_.back().kind_ = kind;
  types_.back().payload_ = std::move(payload);
  map_[key] = id;
  return id;
}

auto TypeArena::operator[](TypeId id) const -> const Type& {
  if (id.value >= types_.size()) {
    throw common::InternalError(
        "TypeArena", fmt::format("type id {} out of range", id.value));
  }
  return types_[id.value];
}

auto ToString(TypeKind kind) -> const char* {
  switch (kind) {
    case TypeKind::kVoid:
      return "void";
    case TypeKind::kLabel:
      return "label";
    case TypeKind::kInteger:
      return "integer";
    case TypeKind::kFloat:
      return "float";
    case TypeKind::kPointer:
      return "pointer";
  }
  return "unknown";
}

auto ToString(const Type& type) -> std::string {
  switch (type.Kind()) {
    case TypeKind::kVoid:
      return "void";
    case TypeKind::kLabel:
      return "label";
    case TypeKind::kInteger:
      return fmt::format("i{}", type.AsInteger().bit_width);
    case TypeKind::kFloat:
      switch (type.AsFloat().kind) {
        case FloatKind::kHalf:
          return "half";
        case FloatKind::kFloat:
          return "float";
        case FloatKind::kDouble:
          return "double";
      }
      break;
    case TypeKind::kPointer: {
      uint32_t addr_space = type.AsPointer().addr_space;
      if (addr_space == 0) {
        return "ptr";
      }
      return fmt::format("ptr addrspace({})", addr_space);
    }
  }
  return "<unknown type>";
}

}  // namespace llasm::ir

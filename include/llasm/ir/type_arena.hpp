#pragma once

#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "llasm/ir/type.hpp"

namespace llasm::ir {

struct TypeKeyHash {
  auto operator()(const TypeKey& key) const -> size_t {
    return absl::HashOf(key.kind, key.payload);
  }
};

// Interns types so equal types share one TypeId; id equality is type
// equality.
class TypeArena final {
 public:
  TypeArena() = default;
  ~TypeArena() = default;

  TypeArena(const TypeArena&) = delete;
  auto operator=(const TypeArena&) -> TypeArena& = delete;

  TypeArena(TypeArena&&) = default;
  auto operator=(TypeArena&&) -> TypeArena& = default;

  auto Intern(TypeKind kind, TypePayload payload) -> TypeId;

  auto Void() -> TypeId {
    return Intern(TypeKind::kVoid, NoPayload{});
  }
  auto Label() -> TypeId {
    return Intern(TypeKind::kLabel, NoPayload{});
  }
  auto Integer(uint32_t bit_width) -> TypeId {
    return Intern(TypeKind::kInteger, IntegerInfo{.bit_width = bit_width});
  }
  auto Float(FloatKind kind) -> TypeId {
    return Intern(TypeKind::kFloat, FloatInfo{.kind = kind});
  }
  auto Pointer(uint32_t addr_space = 0) -> TypeId {
    return Intern(TypeKind::kPointer, PointerInfo{.addr_space = addr_space});
  }

  [[nodiscard]] auto operator[](TypeId id) const -> const Type&;

  [[nodiscard]] auto Size() const -> size_t {
    return types_.size();
  }

 private:
  std::vector<Type> types_;
  absl::flat_hash_map<TypeKey, TypeId, TypeKeyHash> map_;
};

}  // namespace llasm::ir

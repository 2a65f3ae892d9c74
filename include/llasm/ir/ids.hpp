#pragma once

#include <cstdint>
#include <utility>

namespace llasm::ir {

// Index handles into the arenas owned by Module and Function. A handle is
// only meaningful together with the container that issued it.

struct ConstId {
  uint32_t value = UINT32_MAX;

  auto operator==(const ConstId&) const -> bool = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

struct BlockId {
  uint32_t value = UINT32_MAX;

  auto operator==(const BlockId&) const -> bool = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

struct InstId {
  uint32_t value = UINT32_MAX;

  auto operator==(const InstId&) const -> bool = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

// Function parameter, by position.
struct ArgId {
  uint32_t value = UINT32_MAX;

  auto operator==(const ArgId&) const -> bool = default;
};

struct ComdatId {
  uint32_t value = UINT32_MAX;

  auto operator==(const ComdatId&) const -> bool = default;
};

enum class GlobalKind : uint8_t {
  kVariable,
  kFunction,
};

// Module-scope entity named by `@name`.
struct GlobalRef {
  GlobalKind kind = GlobalKind::kVariable;
  uint32_t index = 0;

  auto operator==(const GlobalRef&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const GlobalRef& ref) -> H {
    return H::combine(std::move(h), ref.kind, ref.index);
  }
};

}  // namespace llasm::ir

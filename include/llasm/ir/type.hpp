#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "llasm/common/internal_error.hpp"

namespace llasm::ir {

struct TypeId {
  uint32_t value = UINT32_MAX;

  auto operator==(const TypeId&) const -> bool = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, TypeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

inline constexpr TypeId kInvalidTypeId{};

enum class TypeKind : uint8_t {
  kVoid,
  kLabel,
  kInteger,
  kFloat,
  kPointer,
};

enum class FloatKind : uint8_t {
  kHalf,
  kFloat,
  kDouble,
};

// Payload of void and label.
struct NoPayload {
  auto operator==(const NoPayload&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const NoPayload& /*payload*/) -> H {
    return h;
  }
};

struct IntegerInfo {
  uint32_t bit_width = 0;

  auto operator==(const IntegerInfo&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const IntegerInfo& info) -> H {
    return H::combine(std::move(h), info.bit_width);
  }
};

struct FloatInfo {
  FloatKind kind = FloatKind::kDouble;

  auto operator==(const FloatInfo&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const FloatInfo& info) -> H {
    return H::combine(std::move(h), info.kind);
  }
};

// Opaque pointer (`ptr`, `ptr addrspace(N)`).
struct PointerInfo {
  uint32_t addr_space = 0;

  auto operator==(const PointerInfo&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const PointerInfo& info) -> H {
    return H::combine(std::move(h), info.addr_space);
  }
};

using TypePayload =
    std::variant<NoPayload, IntegerInfo, FloatInfo, PointerInfo>;

struct TypeKey {
  TypeKind kind;
  TypePayload payload;

  auto operator==(const TypeKey&) const -> bool = default;
};

// Largest integer width accepted by `iN`.
inline constexpr uint32_t kMaxIntegerBitWidth = (1U << 23) - 1;

class Type {
 public:
  [[nodiscard]] auto Kind() const -> TypeKind {
    return kind_;
  }

  [[nodiscard]] auto IsInteger() const -> bool {
    return kind_ == TypeKind::kInteger;
  }
  [[nodiscard]] auto IsFloat() const -> bool {
    return kind_ == TypeKind::kFloat;
  }
  [[nodiscard]] auto IsPointer() const -> bool {
    return kind_ == TypeKind::kPointer;
  }
  [[nodiscard]] auto IsVoid() const -> bool {
    return kind_ == TypeKind::kVoid;
  }
  [[nodiscard]] auto IsLabel() const -> bool {
    return kind_ == TypeKind::kLabel;
  }

  [[nodiscard]] auto AsInteger() const -> const IntegerInfo& {
    if (kind_ != TypeKind::kInteger) {
      common::ThrowInternalError("Type::AsInteger", "type is not an integer");
    }
    return std::get<IntegerInfo>(payload_);
  }

  [[nodiscard]] auto AsFloat() const -> const FloatInfo& {
    if (kind_ != TypeKind::kFloat) {
      common::ThrowInternalError("Type::AsFloat", "type is not a float");
    }
    return std::get<FloatInfo>(payload_);
  }

  [[nodiscard]] auto AsPointer() const -> const PointerInfo& {
    if (kind_ != TypeKind::kPointer) {
      common::ThrowInternalError("Type::AsPointer", "type is not a pointer");
    }
    return std::get<PointerInfo>(payload_);
  }

 private:
  friend class TypeArena;

  TypeKind kind_ = TypeKind::kVoid;
  TypePayload payload_;
};

auto ToString(TypeKind kind) -> const char*;

// IR spelling of the type: `i32`, `ptr addrspace(1)`, `double`, ...
auto ToString(const Type& type) -> std::string;

}  // namespace llasm::ir

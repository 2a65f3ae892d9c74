#include "llasm/lowering/ast_to_ir/constant.hpp"

#include <bit>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <fmt/format.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"
#include "llasm/ir/constant.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/literal.hpp"
#include "llasm/lowering/ast_to_ir/type.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

// Largest finite half-precision value.
constexpr double kMaxHalf = 65504.0;

// Binary16 keeps 11 significant bits; exponents below -14 fall into the
// subnormal range where the last bit is worth 2^-24.
auto IsExactHalf(double value) -> bool {
  if (std::fabs(value) > kMaxHalf) {
    return false;
  }
  if (value == 0.0) {
    return true;
  }
  int exponent = 0;
  std::frexp(value, &exponent);
  int scale = exponent >= -13 ? 11 - exponent : 24;
  double scaled = std::ldexp(value, scale);
  return std::trunc(scaled) == scaled;
}

auto IsExactFloat(double value) -> bool {
  if (std::fabs(value) > std::numeric_limits<float>::max()) {
    return false;
  }
  return static_cast<double>(static_cast<float>(value)) == value;
}

auto InvalidForType(
    SourceSpan span, std::string_view what, std::string_view spelling,
    const ir::Type& type) -> Diagnostic {
  return Diagnostic::Error(
             span, fmt::format(
                       "{} '{}' is invalid for type '{}'", what, spelling,
                       ir::ToString(type)))
      .WithCode(DiagCode::kTypeMismatch, std::string(spelling));
}

auto OutOfRange(SourceSpan span, std::string_view spelling, const ir::Type& type)
    -> Diagnostic {
  return Diagnostic::Error(
             span, fmt::format(
                       "constant '{}' is out of range for type '{}'", spelling,
                       ir::ToString(type)))
      .WithCode(DiagCode::kConstantOutOfRange, std::string(spelling));
}

auto WiderThan64Bits(const ast::IntLit& lit) -> Diagnostic {
  return Diagnostic::Unsupported(
             lit.span,
             fmt::format(
                 "support for integer constant '{}' wider than 64 bits not "
                 "yet implemented",
                 lit.text),
             UnsupportedCategory::kFeature)
      .WithCode(DiagCode::kUnsupportedConstant, lit.text);
}

// Parses `u0x...` / `s0x...` hexadecimal integer spellings.
auto ParseHexInteger(std::string_view text) -> std::optional<uint64_t> {
  std::string_view digits = text.substr(3);
  if (digits.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, value, 16);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

auto LowerIntLit(
    ir::TypeId type_id, const ast::IntLit& lit, Context& ctx)
    -> Result<ir::ConstId> {
  const ir::Type type = ctx.Types()[type_id];
  if (!type.IsInteger()) {
    return std::unexpected(
        InvalidForType(lit.span, "integer constant", lit.text, type));
  }
  uint32_t width = type.AsInteger().bit_width;
  uint64_t mask =
      width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;

  std::string_view text = lit.text;
  if (text.starts_with("u0x") || text.starts_with("s0x")) {
    auto value = ParseHexInteger(text);
    if (!value) {
      return std::unexpected(
          Diagnostic::Unsupported(
              lit.span,
              fmt::format(
                  "support for hexadecimal integer constant '{}' not yet "
                  "implemented",
                  lit.text),
              UnsupportedCategory::kFeature)
              .WithCode(DiagCode::kUnsupportedConstant, lit.text));
    }
    if (width < 64 && (*value & ~mask) != 0) {
      return std::unexpected(OutOfRange(lit.span, lit.text, type));
    }
    return ctx.module->constants.Intern(
        type_id, ir::IntegerConstant{.bits = *value});
  }

  bool negative = text.starts_with('-');
  uint64_t bits = 0;
  bool sign_extended = false;
  const char* end = text.data() + text.size();
  if (negative) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), end, value, 10);
    if (ec == std::errc::result_out_of_range && width > 64) {
      return std::unexpected(WiderThan64Bits(lit));
    }
    if (ec == std::errc::result_out_of_range) {
      return std::unexpected(OutOfRange(lit.span, lit.text, type));
    }
    if (ec != std::errc{} || ptr != end) {
      throw common::InternalError(
          "LowerConstant",
          fmt::format("unable to parse integer literal '{}'", lit.text));
    }
    if (width < 64 && value < -(int64_t{1} << (width - 1))) {
      return std::unexpected(OutOfRange(lit.span, lit.text, type));
    }
    bits = static_cast<uint64_t>(value) & mask;
    sign_extended = width > 64 && value < 0;
  } else {
    auto [ptr, ec] = std::from_chars(text.data(), end, bits, 10);
    if (ec == std::errc::result_out_of_range && width > 64) {
      return std::unexpected(WiderThan64Bits(lit));
    }
    if (ec == std::errc::result_out_of_range) {
      return std::unexpected(OutOfRange(lit.span, lit.text, type));
    }
    if (ec != std::errc{} || ptr != end) {
      throw common::InternalError(
          "LowerConstant",
          fmt::format("unable to parse integer literal '{}'", lit.text));
    }
    if ((bits & ~mask) != 0) {
      return std::unexpected(OutOfRange(lit.span, lit.text, type));
    }
  }
  return ctx.module->constants.Intern(
      type_id,
      ir::IntegerConstant{.bits = bits, .sign_extended = sign_extended});
}

auto ParseFloat(const ast::FloatLit& lit) -> Result<double> {
  std::string_view text = lit.text;
  if (text.starts_with("0x")) {
    std::string_view digits = text.substr(2);
    uint64_t raw = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, raw, 16);
    if (digits.size() != 16 || ec != std::errc{} || ptr != end) {
      // 0xH, 0xK, 0xL, 0xM and 0xR name non-double formats.
      return std::unexpected(
          Diagnostic::Unsupported(
              lit.span,
              fmt::format(
                  "support for floating-point constant '{}' not yet "
                  "implemented",
                  lit.text),
              UnsupportedCategory::kFeature)
              .WithCode(DiagCode::kUnsupportedConstant, lit.text));
    }
    return std::bit_cast<double>(raw);
  }

  if (text.starts_with('+')) {
    text.remove_prefix(1);
  }
  double value = 0.0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected(
        Diagnostic::Error(
            lit.span,
            fmt::format("floating-point constant '{}' is out of range", lit.text))
            .WithCode(DiagCode::kConstantOutOfRange, lit.text));
  }
  if (ec != std::errc{} || ptr != end) {
    throw common::InternalError(
        "LowerConstant",
        fmt::format("unable to parse floating-point literal '{}'", lit.text));
  }
  return value;
}

auto LowerFloatLit(ir::TypeId type_id, const ast::FloatLit& lit, Context& ctx)
    -> Result<ir::ConstId> {
  const ir::Type type = ctx.Types()[type_id];
  if (!type.IsFloat()) {
    return std::unexpected(
        InvalidForType(lit.span, "floating-point constant", lit.text, type));
  }
  auto value_or_err = ParseFloat(lit);
  if (!value_or_err) return std::unexpected(value_or_err.error());
  double value = *value_or_err;

  if (!std::isnan(value) && !std::isinf(value)) {
    switch (type.AsFloat().kind) {
      case ir::FloatKind::kFloat:
        if (!IsExactFloat(value)) {
          return std::unexpected(OutOfRange(lit.span, lit.text, type));
        }
        break;
      case ir::FloatKind::kHalf:
        if (!IsExactHalf(value)) {
          return std::unexpected(OutOfRange(lit.span, lit.text, type));
        }
        break;
      case ir::FloatKind::kDouble:
        break;
    }
  }
  return ctx.module->constants.Intern(
      type_id, ir::FloatConstant{.value = value});
}

auto LowerGlobalAddress(
    ir::TypeId type_id, const ast::RawIdentifier& id, Context& ctx)
    -> Result<ir::ConstId> {
  const ir::Type type = ctx.Types()[type_id];
  if (!type.IsPointer()) {
    return std::unexpected(
        InvalidForType(id.span, "global address", id.text, type));
  }
  if (ctx.globals == nullptr) {
    throw common::InternalError(
        "LowerConstant", "global symbol table not available");
  }
  auto ref_or_err = ctx.globals->Resolve(DecodeGlobal(id), id.span);
  if (!ref_or_err) return std::unexpected(ref_or_err.error());
  if (ctx.module->AddressType(*ref_or_err) != type_id) {
    return std::unexpected(
        InvalidForType(id.span, "global address", id.text, type));
  }
  return ctx.module->constants.Intern(
      type_id, ir::GlobalAddressConstant{.global = *ref_or_err});
}

// undef and zeroinitializer exist for every first-class type.
auto IsFirstClass(const ir::Type& type) -> bool {
  return !type.IsVoid() && !type.IsLabel();
}

}  // namespace

auto DefaultConstantLowerer::LowerConstant(
    ir::TypeId type_id, const ast::Value& value, Context& ctx)
    -> Result<ir::ConstId> {
  const ir::Type type = ctx.Types()[type_id];
  return std::visit(
      Overloaded{
          [&](const ast::RawIdentifier& id) -> Result<ir::ConstId> {
            if (id.kind != ast::IdentKind::kGlobal) {
              return std::unexpected(
                  Diagnostic::Error(
                      id.span,
                      fmt::format(
                          "local identifier '{}' is not a constant", id.text))
                      .WithCode(DiagCode::kInvalidOperand, id.text));
            }
            return LowerGlobalAddress(type_id, id, ctx);
          },
          [&](const ast::IntLit& lit) -> Result<ir::ConstId> {
            return LowerIntLit(type_id, lit, ctx);
          },
          [&](const ast::FloatLit& lit) -> Result<ir::ConstId> {
            return LowerFloatLit(type_id, lit, ctx);
          },
          [&](const ast::BoolLit& lit) -> Result<ir::ConstId> {
            if (!type.IsInteger() || type.AsInteger().bit_width != 1) {
              return std::unexpected(
                  InvalidForType(lit.span, "boolean constant", lit.text, type));
            }
            return ctx.module->constants.Intern(
                type_id, ir::IntegerConstant{.bits = DecodeBool(lit) ? 1U : 0U});
          },
          [&](const ast::NullLit& lit) -> Result<ir::ConstId> {
            if (!type.IsPointer()) {
              return std::unexpected(
                  InvalidForType(lit.span, "constant", "null", type));
            }
            return ctx.module->constants.Intern(type_id, ir::NullConstant{});
          },
          [&](const ast::UndefLit& lit) -> Result<ir::ConstId> {
            if (!IsFirstClass(type)) {
              return std::unexpected(
                  InvalidForType(lit.span, "constant", "undef", type));
            }
            return ctx.module->constants.Intern(type_id, ir::UndefConstant{});
          },
          [&](const ast::ZeroInitializerLit& lit) -> Result<ir::ConstId> {
            if (!IsFirstClass(type)) {
              return std::unexpected(
                  InvalidForType(lit.span, "constant", "zeroinitializer", type));
            }
            return ctx.module->constants.Intern(
                type_id, ir::ZeroInitializerConstant{});
          },
      },
      value);
}

auto LowerTypedConstant(const ast::TypedValue& node, Context& ctx)
    -> Result<ir::ConstId> {
  if (ctx.constant_lowerer == nullptr) {
    throw common::InternalError(
        "LowerTypedConstant", "no constant lowerer configured");
  }
  auto type_or_err = LowerType(node.type, ctx);
  if (!type_or_err) return std::unexpected(type_or_err.error());
  return ctx.constant_lowerer->LowerConstant(*type_or_err, node.value, ctx);
}

}  // namespace llasm::lowering::ast_to_ir

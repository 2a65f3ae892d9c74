#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "llasm/common/source_span.hpp"

namespace llasm {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,        // Valid syntax, invalid program
  kUnsupported,  // Valid program, mapping not implemented yet
  kHostError,    // I/O, malformed configuration
  kWarning,      // Non-fatal
  kNote,         // Auxiliary message
};

// Category of unsupported feature (only valid when kind == kUnsupported)
enum class UnsupportedCategory : uint8_t {
  kType,       // Unsupported type spelling (e.g. float, vector)
  kOperation,  // Unsupported opcode or numeric code
  kFeature,    // Unsupported construct
};

// Machine-checkable identity of a diagnostic, independent of its wording.
enum class DiagCode : uint8_t {
  kNone,
  kUnresolvedName,
  kSymbolKindMismatch,
  kRedefinition,
  kTypeMismatch,
  kInvalidType,
  kInvalidOperand,
  kConstantOutOfRange,
  kUnsupportedCallingConvention,
  kUnsupportedType,
  kUnsupportedConstant,
  kConfig,
};

auto ToString(DiagCode code) -> const char*;

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<UnsupportedCategory> category;  // has_value() iff kind ==
                                                // kUnsupported

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes.
// `subject` holds the offending spelling or decoded name, if any.
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;
  DiagCode code = DiagCode::kNone;
  std::string subject;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: semantic error in the IR program
  static auto Error(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .message = std::move(msg),
             .category = std::nullopt},
        .notes = {},
    };
  }

  // Factory: valid program but not yet implemented
  static auto Unsupported(
      SourceSpan span, std::string msg, UnsupportedCategory cat) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kUnsupported,
             .span = span,
             .message = std::move(msg),
             .category = cat},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .category = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = span,
             .message = std::move(msg),
             .category = std::nullopt},
        .notes = {},
    };
  }

  auto WithCode(DiagCode c, std::string subj = {}) && -> Diagnostic {
    code = c;
    subject = std::move(subj);
    return std::move(*this);
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }

  [[nodiscard]] auto IsUnsupported() const -> bool {
    return primary.kind == DiagKind::kUnsupported;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace llasm

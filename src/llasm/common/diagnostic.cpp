#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/format.h>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/diagnostic/render.hpp"
#include "llasm/common/source_manager.hpp"
#include "llasm/common/source_span.hpp"

namespace llasm {

auto ToString(DiagCode code) -> const char* {
  switch (code) {
    case DiagCode::kNone:
      return "none";
    case DiagCode::kUnresolvedName:
      return "unresolved-name";
    case DiagCode::kSymbolKindMismatch:
      return "symbol-kind-mismatch";
    case DiagCode::kRedefinition:
      return "redefinition";
    case DiagCode::kTypeMismatch:
      return "type-mismatch";
    case DiagCode::kInvalidType:
      return "invalid-type";
    case DiagCode::kInvalidOperand:
      return "invalid-operand";
    case DiagCode::kConstantOutOfRange:
      return "constant-out-of-range";
    case DiagCode::kUnsupportedCallingConvention:
      return "unsupported-calling-convention";
    case DiagCode::kUnsupportedType:
      return "unsupported-type";
    case DiagCode::kUnsupportedConstant:
      return "unsupported-constant";
    case DiagCode::kConfig:
      return "config";
  }
  return "unknown";
}

namespace {

auto GetKindString(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kError:
      return "error";
    case DiagKind::kUnsupported:
      return "unsupported";
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

auto GetKindColor(DiagKind kind) -> fmt::terminal_color {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::terminal_color::bright_red;
    case DiagKind::kUnsupported:
      return fmt::terminal_color::bright_magenta;
    case DiagKind::kWarning:
      return fmt::terminal_color::bright_yellow;
    case DiagKind::kNote:
      return fmt::terminal_color::bright_black;
  }
  return fmt::terminal_color::white;
}

// Resolved view of one DiagItem's location; `file` is null when unknown.
struct ItemLocation {
  const FileInfo* file = nullptr;
  LineColumn pos;
  std::string_view source_line;
  size_t range_length = 1;
};

auto ResolveItemLocation(const DiagItem& item, const SourceManager& mgr)
    -> ItemLocation {
  ItemLocation loc;
  const auto* span = std::get_if<SourceSpan>(&item.span);
  if (span == nullptr) {
    return loc;
  }
  loc.file = mgr.GetFile(span->file_id);
  if (loc.file == nullptr) {
    return loc;
  }
  loc.pos = ResolveLineColumn(*span, mgr);
  loc.source_line = SourceManager::LineText(*loc.file, loc.pos.line - 1);

  if (span->end > span->begin) {
    loc.range_length = span->end - span->begin;
  }
  return loc;
}

auto HighlightLine(const ItemLocation& loc) -> std::string {
  std::string highlight(loc.pos.column - 1, ' ');
  highlight += '^';
  if (loc.range_length > 1) {
    highlight += std::string(loc.range_length - 1, '~');
  }
  return highlight;
}

void AppendItem(
    std::string& out, const DiagItem& item, const SourceManager& mgr) {
  ItemLocation loc = ResolveItemLocation(item, mgr);
  if (loc.file != nullptr) {
    out += fmt::format(
        "{}:{}:{}: ", loc.file->path, loc.pos.line, loc.pos.column);
  } else {
    out += "llasm: ";
  }
  out += fmt::format("{}: {}\n", GetKindString(item.kind), item.message);
  if (!loc.source_line.empty()) {
    out += fmt::format("{}\n{}\n", loc.source_line, HighlightLine(loc));
  }
}

void PrintItemColored(
    std::FILE* out, const DiagItem& item, const SourceManager& mgr) {
  constexpr auto kFilenameColor = fmt::terminal_color::cyan;
  constexpr auto kLocationColor = fmt::terminal_color::bright_cyan;
  constexpr auto kHighlightColor = fmt::terminal_color::bright_green;

  ItemLocation loc = ResolveItemLocation(item, mgr);
  if (loc.file != nullptr) {
    fmt::print(
        out, "{}:{}:{}: ",
        fmt::styled(loc.file->path, fmt::fg(kFilenameColor)),
        fmt::styled(loc.pos.line, fmt::fg(kLocationColor)),
        fmt::styled(loc.pos.column, fmt::fg(kLocationColor)));
  } else {
    fmt::print(out, "llasm: ");
  }

  fmt::print(
      out, "{}: {}\n",
      fmt::styled(GetKindString(item.kind), fmt::fg(GetKindColor(item.kind))),
      fmt::styled(item.message, fmt::emphasis::bold));

  if (!loc.source_line.empty()) {
    fmt::print(out, "{}\n", loc.source_line);
    fmt::print(
        out, "{}\n", fmt::styled(HighlightLine(loc), fmt::fg(kHighlightColor)));
  }
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag, const SourceManager& mgr)
    -> std::string {
  std::string out;
  AppendItem(out, diag.primary, mgr);
  for (const auto& note : diag.notes) {
    AppendItem(out, note, mgr);
  }
  return out;
}

void PrintDiagnostic(
    const Diagnostic& diag, const SourceManager& mgr, std::FILE* out,
    bool colors) {
  if (!colors) {
    std::fputs(FormatDiagnostic(diag, mgr).c_str(), out);
    return;
  }
  PrintItemColored(out, diag.primary, mgr);
  for (const auto& note : diag.notes) {
    PrintItemColored(out, note, mgr);
  }
}

}  // namespace llasm

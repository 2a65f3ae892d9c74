#pragma once

#include <cstdint>
#include <string>

#include "llasm/common/source_manager.hpp"

namespace llasm {

// Byte range [begin, end) of a token or node in a source buffer.
struct SourceSpan {
  FileId file_id;
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const SourceSpan&) const -> bool = default;
};

struct LineColumn {
  uint32_t line = 1;
  uint32_t column = 1;
};

// 1-based line/column of span.begin. Returns {1, 1} for unknown files.
auto ResolveLineColumn(const SourceSpan& span, const SourceManager& mgr)
    -> LineColumn;

// Format a SourceSpan as "file:line:col" using the SourceManager.
// Returns empty string if the span or file is invalid.
auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string;

}  // namespace llasm

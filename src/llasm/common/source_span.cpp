#include "llasm/common/source_span.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

namespace llasm {

auto ResolveLineColumn(const SourceSpan& span, const SourceManager& mgr)
    -> LineColumn {
  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return LineColumn{};
  }
  uint32_t index = SourceManager::LineIndex(*file, span.begin);
  auto offset = std::min<uint32_t>(
      span.begin, static_cast<uint32_t>(file->content.size()));
  return LineColumn{
      .line = index + 1,
      .column = offset - file->line_starts[index] + 1,
  };
}

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string {
  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return "";
  }

  LineColumn pos = ResolveLineColumn(span, mgr);
  return fmt::format("{}:{}:{}", file->path, pos.line, pos.column);
}

}  // namespace llasm

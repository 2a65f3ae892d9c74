#include "llasm/common/source_manager.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace llasm {

auto SourceManager::AddFile(std::string path, std::string content) -> FileId {
  FileInfo info{.path = std::move(path), .content = std::move(content)};
  info.line_starts.push_back(0);
  for (size_t i = 0; i < info.content.size(); ++i) {
    if (info.content[i] == '\n') {
      info.line_starts.push_back(static_cast<uint32_t>(i + 1));
    }
  }

  auto value = static_cast<uint32_t>(files_.size() + 1);
  files_.push_back(std::move(info));
  return FileId{.value = value};
}

auto SourceManager::LineIndex(const FileInfo& file, uint32_t offset)
    -> uint32_t {
  auto clamped = std::min<size_t>(offset, file.content.size());
  auto it = std::ranges::upper_bound(file.line_starts, clamped);
  return static_cast<uint32_t>(it - file.line_starts.begin() - 1);
}

auto SourceManager::LineText(const FileInfo& file, uint32_t index)
    -> std::string_view {
  if (index >= file.line_starts.size()) {
    return {};
  }
  std::string_view text = file.content;
  std::string_view line = text.substr(file.line_starts[index]);
  size_t end = line.find_first_of("\r\n");
  return end == std::string_view::npos ? line : line.substr(0, end);
}

}  // namespace llasm

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace llasm {

struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
};

inline constexpr FileId kInvalidFileId{};

struct FileInfo {
  std::string path;
  std::string content;
  // Byte offset of the first character of each line; line_starts[0] == 0.
  std::vector<uint32_t> line_starts;
};

// Owns the text of every `.ll` buffer the parser saw, so spans carried by
// syntax nodes can be rendered back as file:line:col. Line starts are
// indexed once when a buffer is added.
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId;

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo* {
    if (!id || id.value > files_.size()) {
      return nullptr;
    }
    return &files_[id.value - 1];
  }

  // 0-based index of the line containing `offset`; offsets past the end
  // clamp to the last line.
  [[nodiscard]] static auto LineIndex(const FileInfo& file, uint32_t offset)
      -> uint32_t;

  // Text of line `index` without its terminator.
  [[nodiscard]] static auto LineText(const FileInfo& file, uint32_t index)
      -> std::string_view;

 private:
  std::vector<FileInfo> files_;
};

}  // namespace llasm

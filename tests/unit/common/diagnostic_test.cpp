#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/diagnostic/diagnostic_sink.hpp"
#include "llasm/common/diagnostic/render.hpp"
#include "llasm/common/source_manager.hpp"
#include "llasm/common/source_span.hpp"

namespace llasm {
namespace {

class DiagnosticTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_ = mgr_.AddFile("t.ll", "define void @f() {\n  ret i32 %x\n}\n");
  }

  auto Span(uint32_t begin, uint32_t end) -> SourceSpan {
    return SourceSpan{.file_id = file_, .begin = begin, .end = end};
  }

  SourceManager mgr_;
  FileId file_;
};

TEST_F(DiagnosticTest, LineColumnCountsNewlines) {
  LineColumn pos = ResolveLineColumn(Span(21, 24), mgr_);
  EXPECT_EQ(pos.line, 2);
  EXPECT_EQ(pos.column, 3);
  EXPECT_EQ(FormatSourceLocation(Span(21, 24), mgr_), "t.ll:2:3");
}

TEST_F(DiagnosticTest, LineIndexIsBuiltOnAdd) {
  const FileInfo* file = mgr_.GetFile(file_);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->line_starts, (std::vector<uint32_t>{0, 19, 32, 34}));
  EXPECT_EQ(SourceManager::LineIndex(*file, 18), 0);
  EXPECT_EQ(SourceManager::LineIndex(*file, 19), 1);
  EXPECT_EQ(SourceManager::LineIndex(*file, 1000), 3);
  EXPECT_EQ(SourceManager::LineText(*file, 1), "  ret i32 %x");
  EXPECT_EQ(SourceManager::LineText(*file, 3), "");
  EXPECT_EQ(SourceManager::LineText(*file, 9), "");
}

TEST_F(DiagnosticTest, LastLineWithoutNewline) {
  FileId other = mgr_.AddFile("u.ll", "a\r\nbc");
  const FileInfo* file = mgr_.GetFile(other);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(SourceManager::LineText(*file, 0), "a");
  EXPECT_EQ(SourceManager::LineText(*file, 1), "bc");
  EXPECT_EQ(
      FormatSourceLocation(
          SourceSpan{.file_id = other, .begin = 4, .end = 5}, mgr_),
      "u.ll:2:2");
}

TEST_F(DiagnosticTest, UnknownFileHasNoLocation) {
  EXPECT_EQ(FormatSourceLocation(SourceSpan{}, mgr_), "");
}

TEST_F(DiagnosticTest, BuildersAttachCodeAndNotes) {
  Diagnostic diag = Diagnostic::Error(Span(29, 31), "bad operand")
                        .WithCode(DiagCode::kUnresolvedName, "x")
                        .WithNote(Span(0, 6), "in here")
                        .WithNote("context");
  EXPECT_EQ(diag.code, DiagCode::kUnresolvedName);
  EXPECT_EQ(diag.subject, "x");
  ASSERT_EQ(diag.notes.size(), 2);
  EXPECT_EQ(diag.notes[0].kind, DiagKind::kNote);
  EXPECT_TRUE(std::holds_alternative<UnknownSpan>(diag.notes[1].span));
  EXPECT_FALSE(diag.IsUnsupported());
}

TEST_F(DiagnosticTest, FormatRendersSourceLineAndHighlight) {
  Diagnostic diag = Diagnostic::Error(Span(29, 31), "unable to locate '%x'");
  std::string text = FormatDiagnostic(diag, mgr_);
  EXPECT_EQ(
      text,
      "t.ll:2:11: error: unable to locate '%x'\n"
      "  ret i32 %x\n"
      "          ^~\n");
}

TEST_F(DiagnosticTest, HostErrorRendersWithoutLocation) {
  std::string text =
      FormatDiagnostic(Diagnostic::HostError("cannot read config"), mgr_);
  EXPECT_EQ(text, "llasm: error: cannot read config\n");
}

TEST_F(DiagnosticTest, SinkCountsErrorsButNotWarnings) {
  DiagnosticSink sink;
  sink.Warning(Span(0, 1), "w");
  EXPECT_FALSE(sink.HasErrors());
  sink.Error(Span(0, 1), "e");
  sink.Unsupported(Span(0, 1), "u", UnsupportedCategory::kType);
  EXPECT_EQ(sink.ErrorCount(), 2);
  EXPECT_EQ(sink.GetDiagnostics().size(), 3);
  sink.Clear();
  EXPECT_FALSE(sink.HasErrors());
}

TEST_F(DiagnosticTest, CodeNamesAreStable) {
  EXPECT_STREQ(ToString(DiagCode::kUnresolvedName), "unresolved-name");
  EXPECT_STREQ(
      ToString(DiagCode::kUnsupportedCallingConvention),
      "unsupported-calling-convention");
}

}  // namespace
}  // namespace llasm

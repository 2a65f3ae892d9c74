#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "llasm/common/diagnostic/diagnostic.hpp"

namespace llasm {

// Collects diagnostics during lowering. Not thread-safe; one sink per
// lowering run. Diagnostics are stored in order of reporting.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kUnsupported ||
        diag.primary.kind == DiagKind::kHostError) {
      ++error_count_;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Error(loc, std::move(msg)));
  }

  void Unsupported(SourceSpan loc, std::string msg, UnsupportedCategory cat) {
    Report(Diagnostic::Unsupported(loc, std::move(msg), cat));
  }

  void Warning(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Warning(loc, std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return error_count_ != 0;
  }

  [[nodiscard]] auto ErrorCount() const -> size_t {
    return error_count_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  void Clear() {
    diagnostics_.clear();
    error_count_ = 0;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  size_t error_count_ = 0;
};

}  // namespace llasm

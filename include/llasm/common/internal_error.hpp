#pragma once

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace llasm::common {

// Raised when a syntax tree violates the parser/lowering contract (missing
// sigil, unknown keyword spelling, malformed literal). Never user input.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "The syntax tree violates the grammar contract assumed by "
                "llasm lowering.",
                context, detail)),
        context_(context),
        detail_(detail) {
  }

  [[nodiscard]] auto Context() const -> const std::string& {
    return context_;
  }
  [[nodiscard]] auto Detail() const -> const std::string& {
    return detail_;
  }

 private:
  std::string context_;
  std::string detail_;
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace llasm::common

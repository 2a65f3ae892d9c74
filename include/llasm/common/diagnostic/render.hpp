#pragma once

#include <cstdio>
#include <string>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/source_manager.hpp"

namespace llasm {

// Render one diagnostic (primary plus notes) as plain text:
//   file:line:col: error: message
//     <source line>
//     ^~~~
// Items without a known span render as "llasm: error: message".
auto FormatDiagnostic(const Diagnostic& diag, const SourceManager& mgr)
    -> std::string;

// Print a diagnostic to `out`, colorized when `colors` is set.
void PrintDiagnostic(
    const Diagnostic& diag, const SourceManager& mgr, std::FILE* out = stderr,
    bool colors = true);

}  // namespace llasm

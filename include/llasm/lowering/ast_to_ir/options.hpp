#pragma once

#include <cstddef>

namespace llasm::lowering::ast_to_ir {

struct LoweringOptions {
  // Stop after this many errors; 0 means unlimited.
  size_t max_errors = 0;
  // When false, stop at the first top-level entity that fails to lower.
  bool keep_going = true;
};

}  // namespace llasm::lowering::ast_to_ir

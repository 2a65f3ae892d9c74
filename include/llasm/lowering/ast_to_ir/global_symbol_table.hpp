#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/common/source_span.hpp"
#include "llasm/ir/ids.hpp"

namespace llasm::lowering::ast_to_ir {

// Module-scope names. `@name` (global variables and functions) and `$name`
// (comdats) are separate namespaces. Filled by module pass 1, read by
// pass 2 and by every function lowering.
class GlobalSymbolTable {
 public:
  auto Declare(std::string name, ir::GlobalRef ref, SourceSpan definition)
      -> Result<void>;
  auto DeclareComdat(std::string name, ir::ComdatId id, SourceSpan definition)
      -> Result<void>;

  [[nodiscard]] auto Resolve(std::string_view name, SourceSpan use) const
      -> Result<ir::GlobalRef>;
  [[nodiscard]] auto ResolveComdat(std::string_view name, SourceSpan use) const
      -> Result<ir::ComdatId>;

  [[nodiscard]] auto Size() const -> size_t {
    return globals_.size();
  }
  [[nodiscard]] auto ComdatCount() const -> size_t {
    return comdats_.size();
  }

 private:
  template <typename Id>
  struct Entry {
    Id id;
    SourceSpan definition;
  };

  absl::flat_hash_map<std::string, Entry<ir::GlobalRef>> globals_;
  absl::flat_hash_map<std::string, Entry<ir::ComdatId>> comdats_;
};

}  // namespace llasm::lowering::ast_to_ir

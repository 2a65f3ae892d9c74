#include "llasm/ir/enums.hpp"

#include <string_view>

#include "llasm/ir/enum_table.hpp"

namespace llasm::ir {

namespace {

// Table keywords are string literals, so data() is NUL-terminated.
auto CStr(std::string_view keyword) -> const char* {
  return keyword.empty() ? "" : keyword.data();
}

}  // namespace

auto ToString(Linkage v) -> const char* {
  return CStr(FindKeyword(kLinkageTable, v));
}

auto ToString(Visibility v) -> const char* {
  return CStr(FindKeyword(kVisibilityTable, v));
}

auto ToString(DllStorageClass v) -> const char* {
  return CStr(FindKeyword(kDllStorageClassTable, v));
}

auto ToString(Preemption v) -> const char* {
  return CStr(FindKeyword(kPreemptionTable, v));
}

auto ToString(UnnamedAddr v) -> const char* {
  return CStr(FindKeyword(kUnnamedAddrTable, v));
}

auto ToString(TlsModel v) -> const char* {
  return CStr(FindKeyword(kTlsModelTable, v));
}

auto ToString(SelectionKind v) -> const char* {
  return CStr(FindKeyword(kSelectionKindTable, v));
}

auto ToString(CallingConv v) -> const char* {
  std::string_view keyword = FindKeyword(kCallingConvTable, v);
  if (!keyword.empty()) {
    return keyword.data();
  }
  for (const auto& row : kNumericCallingConvTable) {
    if (row.value == v) {
      return row.spelling.data();
    }
  }
  return "";
}

auto ToString(AtomicOrdering v) -> const char* {
  return CStr(FindKeyword(kAtomicOrderingTable, v));
}

auto ToString(AtomicOp v) -> const char* {
  return CStr(FindKeyword(kAtomicOpTable, v));
}

auto ToString(IPred v) -> const char* {
  return CStr(FindKeyword(kIPredTable, v));
}

auto ToString(FPred v) -> const char* {
  return CStr(FindKeyword(kFPredTable, v));
}

auto ToString(Tail v) -> const char* {
  return CStr(FindKeyword(kTailTable, v));
}

auto ToString(FastMathFlag v) -> const char* {
  return CStr(FindKeyword(kFastMathFlagTable, v));
}

auto ToString(OverflowFlag v) -> const char* {
  return CStr(FindKeyword(kOverflowFlagTable, v));
}

auto ToString(Immutable v) -> const char* {
  return CStr(FindKeyword(kImmutableTable, v));
}

auto ToString(BinaryOpcode v) -> const char* {
  return CStr(FindKeyword(kBinaryOpcodeTable, v));
}

}  // namespace llasm::ir

#pragma once

#include <cstdint>

namespace llasm::ir {

// Every optional category carries kNone: "attribute absent" is a value of the
// enum, never a separate flag.

enum class Linkage : uint8_t {
  kNone,
  kAppending,
  kAvailableExternally,
  kCommon,
  kInternal,
  kLinkOnce,
  kLinkOnceOdr,
  kPrivate,
  kWeak,
  kWeakOdr,
  kExternal,
  kExternWeak,
};

enum class Visibility : uint8_t {
  kNone,
  kDefault,
  kHidden,
  kProtected,
};

enum class DllStorageClass : uint8_t {
  kNone,
  kDllExport,
  kDllImport,
};

enum class Preemption : uint8_t {
  kNone,
  kDsoLocal,
  kDsoPreemptable,
};

enum class UnnamedAddr : uint8_t {
  kNone,
  kLocalUnnamedAddr,
  kUnnamedAddr,
};

// kGeneralDynamic is what a bare `thread_local` means; it has no spelling
// inside `thread_local(...)`.
enum class TlsModel : uint8_t {
  kNone,
  kGeneralDynamic,
  kInitialExec,
  kLocalDynamic,
  kLocalExec,
};

enum class SelectionKind : uint8_t {
  kAny,
  kExactMatch,
  kLargest,
  kNoDuplicates,
  kSameSize,
};

enum class CallingConv : uint8_t {
  kNone,
  kC,
  kFast,
  kCold,
  kGhc,
  kHiPE,
  kWebKitJS,
  kAnyReg,
  kPreserveMost,
  kPreserveAll,
  kSwift,
  kCxxFastTls,
  kX86StdCall,
  kX86FastCall,
  kArmApcs,
  kArmAapcs,
  kArmAapcsVfp,
  kMsp430Intr,
  kX86ThisCall,
  kPtxKernel,
  kPtxDevice,
  kSpirFunc,
  kSpirKernel,
  kIntelOclBi,
  kX8664SysV,
  kWin64,
  kX86VectorCall,
  kHhvm,
  kHhvmC,
  kX86Intr,
  kAvrIntr,
  kAvrSignal,
  kAvrBuiltin,
  kAmdgpuVs,
  kAmdgpuGs,
  kAmdgpuPs,
  kAmdgpuCs,
  kAmdgpuKernel,
  kX86RegCall,
  kAmdgpuHs,
  kMsp430Builtin,
  kAmdgpuLs,
  kAmdgpuEs,
};

enum class AtomicOrdering : uint8_t {
  kNone,
  kUnordered,
  kMonotonic,
  kAcquire,
  kRelease,
  kAcqRel,
  kSeqCst,
};

enum class AtomicOp : uint8_t {
  kXchg,
  kAdd,
  kSub,
  kAnd,
  kNand,
  kOr,
  kXor,
  kMax,
  kMin,
  kUMax,
  kUMin,
  kFAdd,
  kFSub,
};

enum class IPred : uint8_t {
  kEq,
  kNe,
  kSge,
  kSgt,
  kSle,
  kSlt,
  kUge,
  kUgt,
  kUle,
  kUlt,
};

enum class FPred : uint8_t {
  kFalse,
  kOeq,
  kOge,
  kOgt,
  kOle,
  kOlt,
  kOne,
  kOrd,
  kTrue,
  kUeq,
  kUge,
  kUgt,
  kUle,
  kUlt,
  kUne,
  kUno,
};

enum class Tail : uint8_t {
  kNone,
  kMustTail,
  kNoTail,
  kTail,
};

// Bit positions inside FastMathFlags.
enum class FastMathFlag : uint8_t {
  kAfn,
  kArcp,
  kContract,
  kFast,
  kNinf,
  kNnan,
  kNsz,
  kReassoc,
};

// Bit positions inside OverflowFlags.
enum class OverflowFlag : uint8_t {
  kNsw,
  kNuw,
};

enum class Immutable : uint8_t {
  kGlobal,
  kConstant,
};

enum class BinaryOpcode : uint8_t {
  kAdd,
  kSub,
  kMul,
  kUDiv,
  kSDiv,
  kURem,
  kSRem,
  kShl,
  kLShr,
  kAShr,
  kAnd,
  kOr,
  kXor,
};

// Opcodes that accept `nuw`/`nsw`.
constexpr auto AcceptsOverflowFlags(BinaryOpcode op) -> bool {
  switch (op) {
    case BinaryOpcode::kAdd:
    case BinaryOpcode::kSub:
    case BinaryOpcode::kMul:
    case BinaryOpcode::kShl:
      return true;
    default:
      return false;
  }
}

// Opcodes that accept `exact`.
constexpr auto AcceptsExact(BinaryOpcode op) -> bool {
  switch (op) {
    case BinaryOpcode::kUDiv:
    case BinaryOpcode::kSDiv:
    case BinaryOpcode::kLShr:
    case BinaryOpcode::kAShr:
      return true;
    default:
      return false;
  }
}

// Independently settable flag set over a small flag enum.
template <typename Flag>
class FlagSet {
 public:
  constexpr FlagSet() = default;

  constexpr void Set(Flag flag) {
    bits_ |= Bit(flag);
  }
  [[nodiscard]] constexpr auto Has(Flag flag) const -> bool {
    return (bits_ & Bit(flag)) != 0;
  }
  [[nodiscard]] constexpr auto Empty() const -> bool {
    return bits_ == 0;
  }
  [[nodiscard]] constexpr auto Bits() const -> uint32_t {
    return bits_;
  }

  auto operator==(const FlagSet&) const -> bool = default;

 private:
  static constexpr auto Bit(Flag flag) -> uint32_t {
    return uint32_t{1} << static_cast<uint32_t>(flag);
  }

  uint32_t bits_ = 0;
};

using FastMathFlags = FlagSet<FastMathFlag>;
using OverflowFlags = FlagSet<OverflowFlag>;

// Keyword spelling of each value. The kNone sentinels and
// TlsModel::kGeneralDynamic have no keyword and return "".
auto ToString(Linkage v) -> const char*;
auto ToString(Visibility v) -> const char*;
auto ToString(DllStorageClass v) -> const char*;
auto ToString(Preemption v) -> const char*;
auto ToString(UnnamedAddr v) -> const char*;
auto ToString(TlsModel v) -> const char*;
auto ToString(SelectionKind v) -> const char*;
auto ToString(CallingConv v) -> const char*;
auto ToString(AtomicOrdering v) -> const char*;
auto ToString(AtomicOp v) -> const char*;
auto ToString(IPred v) -> const char*;
auto ToString(FPred v) -> const char*;
auto ToString(Tail v) -> const char*;
auto ToString(FastMathFlag v) -> const char*;
auto ToString(OverflowFlag v) -> const char*;
auto ToString(Immutable v) -> const char*;
auto ToString(BinaryOpcode v) -> const char*;

}  // namespace llasm::ir

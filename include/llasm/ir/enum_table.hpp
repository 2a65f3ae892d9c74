#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "llasm/ir/enums.hpp"

namespace llasm::ir {

// One row of a closed keyword vocabulary. Each table is a bijection between
// exact spelling and enum value; sentinel values (kNone) never appear.
template <typename E>
struct KeywordSpelling {
  std::string_view keyword;
  E value;
};

template <typename E, size_t N>
constexpr auto FindByKeyword(
    const std::array<KeywordSpelling<E>, N>& table, std::string_view keyword)
    -> std::optional<E> {
  for (const auto& row : table) {
    if (row.keyword == keyword) {
      return row.value;
    }
  }
  return std::nullopt;
}

template <typename E, size_t N>
constexpr auto FindKeyword(
    const std::array<KeywordSpelling<E>, N>& table, E value)
    -> std::string_view {
  for (const auto& row : table) {
    if (row.value == value) {
      return row.keyword;
    }
  }
  return {};
}

template <typename E, size_t N>
constexpr auto IsBijection(const std::array<KeywordSpelling<E>, N>& table)
    -> bool {
  for (size_t i = 0; i < N; ++i) {
    if (table[i].keyword.empty()) {
      return false;
    }
    for (size_t j = i + 1; j < N; ++j) {
      if (table[i].keyword == table[j].keyword ||
          table[i].value == table[j].value) {
        return false;
      }
    }
  }
  return true;
}

// clang-format off
inline constexpr std::array kLinkageTable = std::to_array<KeywordSpelling<Linkage>>({
  {"appending",            Linkage::kAppending},
  {"available_externally", Linkage::kAvailableExternally},
  {"common",               Linkage::kCommon},
  {"internal",             Linkage::kInternal},
  {"linkonce",             Linkage::kLinkOnce},
  {"linkonce_odr",         Linkage::kLinkOnceOdr},
  {"private",              Linkage::kPrivate},
  {"weak",                 Linkage::kWeak},
  {"weak_odr",             Linkage::kWeakOdr},
  {"external",             Linkage::kExternal},
  {"extern_weak",          Linkage::kExternWeak},
});

inline constexpr std::array kVisibilityTable = std::to_array<KeywordSpelling<Visibility>>({
  {"default",   Visibility::kDefault},
  {"hidden",    Visibility::kHidden},
  {"protected", Visibility::kProtected},
});

inline constexpr std::array kDllStorageClassTable = std::to_array<KeywordSpelling<DllStorageClass>>({
  {"dllexport", DllStorageClass::kDllExport},
  {"dllimport", DllStorageClass::kDllImport},
});

inline constexpr std::array kPreemptionTable = std::to_array<KeywordSpelling<Preemption>>({
  {"dso_local",       Preemption::kDsoLocal},
  {"dso_preemptable", Preemption::kDsoPreemptable},
});

inline constexpr std::array kUnnamedAddrTable = std::to_array<KeywordSpelling<UnnamedAddr>>({
  {"local_unnamed_addr", UnnamedAddr::kLocalUnnamedAddr},
  {"unnamed_addr",       UnnamedAddr::kUnnamedAddr},
});

inline constexpr std::array kTlsModelTable = std::to_array<KeywordSpelling<TlsModel>>({
  {"initialexec",  TlsModel::kInitialExec},
  {"localdynamic", TlsModel::kLocalDynamic},
  {"localexec",    TlsModel::kLocalExec},
});

inline constexpr std::array kSelectionKindTable = std::to_array<KeywordSpelling<SelectionKind>>({
  {"any",          SelectionKind::kAny},
  {"exactmatch",   SelectionKind::kExactMatch},
  {"largest",      SelectionKind::kLargest},
  {"noduplicates", SelectionKind::kNoDuplicates},
  {"samesize",     SelectionKind::kSameSize},
});

inline constexpr std::array kCallingConvTable = std::to_array<KeywordSpelling<CallingConv>>({
  {"ccc",              CallingConv::kC},
  {"fastcc",           CallingConv::kFast},
  {"coldcc",           CallingConv::kCold},
  {"ghccc",            CallingConv::kGhc},
  {"webkit_jscc",      CallingConv::kWebKitJS},
  {"anyregcc",         CallingConv::kAnyReg},
  {"preserve_mostcc",  CallingConv::kPreserveMost},
  {"preserve_allcc",   CallingConv::kPreserveAll},
  {"swiftcc",          CallingConv::kSwift},
  {"cxx_fast_tlscc",   CallingConv::kCxxFastTls},
  {"x86_stdcallcc",    CallingConv::kX86StdCall},
  {"x86_fastcallcc",   CallingConv::kX86FastCall},
  {"arm_apcscc",       CallingConv::kArmApcs},
  {"arm_aapcscc",      CallingConv::kArmAapcs},
  {"arm_aapcs_vfpcc",  CallingConv::kArmAapcsVfp},
  {"msp430_intrcc",    CallingConv::kMsp430Intr},
  {"x86_thiscallcc",   CallingConv::kX86ThisCall},
  {"ptx_kernel",       CallingConv::kPtxKernel},
  {"ptx_device",       CallingConv::kPtxDevice},
  {"spir_func",        CallingConv::kSpirFunc},
  {"spir_kernel",      CallingConv::kSpirKernel},
  {"intel_ocl_bicc",   CallingConv::kIntelOclBi},
  {"x86_64_sysvcc",    CallingConv::kX8664SysV},
  {"win64cc",          CallingConv::kWin64},
  {"x86_vectorcallcc", CallingConv::kX86VectorCall},
  {"hhvmcc",           CallingConv::kHhvm},
  {"hhvm_ccc",         CallingConv::kHhvmC},
  {"x86_intrcc",       CallingConv::kX86Intr},
  {"avr_intrcc",       CallingConv::kAvrIntr},
  {"avr_signalcc",     CallingConv::kAvrSignal},
  {"amdgpu_vs",        CallingConv::kAmdgpuVs},
  {"amdgpu_gs",        CallingConv::kAmdgpuGs},
  {"amdgpu_ps",        CallingConv::kAmdgpuPs},
  {"amdgpu_cs",        CallingConv::kAmdgpuCs},
  {"amdgpu_kernel",    CallingConv::kAmdgpuKernel},
  {"x86_regcallcc",    CallingConv::kX86RegCall},
  {"amdgpu_hs",        CallingConv::kAmdgpuHs},
  {"amdgpu_ls",        CallingConv::kAmdgpuLs},
  {"amdgpu_es",        CallingConv::kAmdgpuEs},
});

inline constexpr std::array kAtomicOrderingTable = std::to_array<KeywordSpelling<AtomicOrdering>>({
  {"unordered", AtomicOrdering::kUnordered},
  {"monotonic", AtomicOrdering::kMonotonic},
  {"acquire",   AtomicOrdering::kAcquire},
  {"release",   AtomicOrdering::kRelease},
  {"acq_rel",   AtomicOrdering::kAcqRel},
  {"seq_cst",   AtomicOrdering::kSeqCst},
});

inline constexpr std::array kAtomicOpTable = std::to_array<KeywordSpelling<AtomicOp>>({
  {"xchg", AtomicOp::kXchg},
  {"add",  AtomicOp::kAdd},
  {"sub",  AtomicOp::kSub},
  {"and",  AtomicOp::kAnd},
  {"nand", AtomicOp::kNand},
  {"or",   AtomicOp::kOr},
  {"xor",  AtomicOp::kXor},
  {"max",  AtomicOp::kMax},
  {"min",  AtomicOp::kMin},
  {"umax", AtomicOp::kUMax},
  {"umin", AtomicOp::kUMin},
  {"fadd", AtomicOp::kFAdd},
  {"fsub", AtomicOp::kFSub},
});

inline constexpr std::array kIPredTable = std::to_array<KeywordSpelling<IPred>>({
  {"eq",  IPred::kEq},
  {"ne",  IPred::kNe},
  {"sge", IPred::kSge},
  {"sgt", IPred::kSgt},
  {"sle", IPred::kSle},
  {"slt", IPred::kSlt},
  {"uge", IPred::kUge},
  {"ugt", IPred::kUgt},
  {"ule", IPred::kUle},
  {"ult", IPred::kUlt},
});

inline constexpr std::array kFPredTable = std::to_array<KeywordSpelling<FPred>>({
  {"false", FPred::kFalse},
  {"oeq",   FPred::kOeq},
  {"oge",   FPred::kOge},
  {"ogt",   FPred::kOgt},
  {"ole",   FPred::kOle},
  {"olt",   FPred::kOlt},
  {"one",   FPred::kOne},
  {"ord",   FPred::kOrd},
  {"true",  FPred::kTrue},
  {"ueq",   FPred::kUeq},
  {"uge",   FPred::kUge},
  {"ugt",   FPred::kUgt},
  {"ule",   FPred::kUle},
  {"ult",   FPred::kUlt},
  {"une",   FPred::kUne},
  {"uno",   FPred::kUno},
});

inline constexpr std::array kTailTable = std::to_array<KeywordSpelling<Tail>>({
  {"musttail", Tail::kMustTail},
  {"notail",   Tail::kNoTail},
  {"tail",     Tail::kTail},
});

inline constexpr std::array kFastMathFlagTable = std::to_array<KeywordSpelling<FastMathFlag>>({
  {"afn",      FastMathFlag::kAfn},
  {"arcp",     FastMathFlag::kArcp},
  {"contract", FastMathFlag::kContract},
  {"fast",     FastMathFlag::kFast},
  {"ninf",     FastMathFlag::kNinf},
  {"nnan",     FastMathFlag::kNnan},
  {"nsz",      FastMathFlag::kNsz},
  {"reassoc",  FastMathFlag::kReassoc},
});

inline constexpr std::array kOverflowFlagTable = std::to_array<KeywordSpelling<OverflowFlag>>({
  {"nsw", OverflowFlag::kNsw},
  {"nuw", OverflowFlag::kNuw},
});

inline constexpr std::array kImmutableTable = std::to_array<KeywordSpelling<Immutable>>({
  {"global",   Immutable::kGlobal},
  {"constant", Immutable::kConstant},
});

inline constexpr std::array kBinaryOpcodeTable = std::to_array<KeywordSpelling<BinaryOpcode>>({
  {"add",  BinaryOpcode::kAdd},
  {"sub",  BinaryOpcode::kSub},
  {"mul",  BinaryOpcode::kMul},
  {"udiv", BinaryOpcode::kUDiv},
  {"sdiv", BinaryOpcode::kSDiv},
  {"urem", BinaryOpcode::kURem},
  {"srem", BinaryOpcode::kSRem},
  {"shl",  BinaryOpcode::kShl},
  {"lshr", BinaryOpcode::kLShr},
  {"ashr", BinaryOpcode::kAShr},
  {"and",  BinaryOpcode::kAnd},
  {"or",   BinaryOpcode::kOr},
  {"xor",  BinaryOpcode::kXor},
});
// clang-format on

static_assert(IsBijection(kLinkageTable));
static_assert(IsBijection(kVisibilityTable));
static_assert(IsBijection(kDllStorageClassTable));
static_assert(IsBijection(kPreemptionTable));
static_assert(IsBijection(kUnnamedAddrTable));
static_assert(IsBijection(kTlsModelTable));
static_assert(IsBijection(kSelectionKindTable));
static_assert(IsBijection(kCallingConvTable));
static_assert(IsBijection(kAtomicOrderingTable));
static_assert(IsBijection(kAtomicOpTable));
static_assert(IsBijection(kIPredTable));
static_assert(IsBijection(kFPredTable));
static_assert(IsBijection(kTailTable));
static_assert(IsBijection(kFastMathFlagTable));
static_assert(IsBijection(kOverflowFlagTable));
static_assert(IsBijection(kImmutableTable));
static_assert(IsBijection(kBinaryOpcodeTable));

// Vendor conventions reachable only through the numeric `cc N` form (or, for
// the AMDGPU ones, through both forms). The code set is disjoint and closed;
// anything else is not implemented.
struct NumericCallingConv {
  uint64_t code;
  CallingConv value;
  std::string_view spelling;
};

// clang-format off
inline constexpr std::array kNumericCallingConvTable = std::to_array<NumericCallingConv>({
  {.code = 11, .value = CallingConv::kHiPE,          .spelling = "cc 11"},
  {.code = 86, .value = CallingConv::kAvrBuiltin,    .spelling = "cc 86"},
  {.code = 87, .value = CallingConv::kAmdgpuVs,      .spelling = "cc 87"},
  {.code = 88, .value = CallingConv::kAmdgpuGs,      .spelling = "cc 88"},
  {.code = 89, .value = CallingConv::kAmdgpuPs,      .spelling = "cc 89"},
  {.code = 90, .value = CallingConv::kAmdgpuCs,      .spelling = "cc 90"},
  {.code = 91, .value = CallingConv::kAmdgpuKernel,  .spelling = "cc 91"},
  {.code = 93, .value = CallingConv::kAmdgpuHs,      .spelling = "cc 93"},
  {.code = 94, .value = CallingConv::kMsp430Builtin, .spelling = "cc 94"},
  {.code = 95, .value = CallingConv::kAmdgpuLs,      .spelling = "cc 95"},
  {.code = 96, .value = CallingConv::kAmdgpuEs,      .spelling = "cc 96"},
});
// clang-format on

constexpr auto FindNumericCallingConv(uint64_t code)
    -> std::optional<CallingConv> {
  for (const auto& row : kNumericCallingConvTable) {
    if (row.code == code) {
      return row.value;
    }
  }
  return std::nullopt;
}

}  // namespace llasm::ir

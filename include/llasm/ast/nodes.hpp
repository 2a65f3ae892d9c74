#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "llasm/common/source_span.hpp"

// Syntax tree shapes produced by a grammar-conformant `.ll` parser.
//
// Every token keeps its exact source spelling (sigils, quotes and escapes
// included); decoding is the job of lowering. Nodes are assumed to be
// grammar-validated: lowering treats a malformed node as a contract
// violation, not as a user error.
namespace llasm::ast {

// Source spelling of one token. The tag parameter keeps token categories
// from being mixed up at call sites.
template <typename Tag>
struct TokenOf {
  std::string text;
  SourceSpan span{};
};

using Keyword = TokenOf<struct KeywordTag>;
using BoolLit = TokenOf<struct BoolLitTag>;
using UintLit = TokenOf<struct UintLitTag>;
using IntLit = TokenOf<struct IntLitTag>;
using FloatLit = TokenOf<struct FloatLitTag>;
using StringLit = TokenOf<struct StringLitTag>;

enum class IdentKind : uint8_t {
  kGlobal,  // @name, @"quoted", @42
  kLocal,   // %name, %"quoted", %42
  kLabel,   // name:, "quoted":
  kComdat,  // $name, $"quoted"
};

struct RawIdentifier {
  IdentKind kind = IdentKind::kLocal;
  std::string text;
  SourceSpan span{};
};

// --- Types -------------------------------------------------------------------

// Type spelling such as `i32`, `ptr`, `void`, `label`, `double`.
// `addr_space` is only present on `ptr addrspace(N)`.
struct Type {
  std::string text;
  std::optional<UintLit> addr_space;
  SourceSpan span{};
};

// --- Values ------------------------------------------------------------------

struct NullLit {
  SourceSpan span{};
};

struct UndefLit {
  SourceSpan span{};
};

struct ZeroInitializerLit {
  SourceSpan span{};
};

// Operand spelling. RawIdentifier covers both `%local` and `@global`.
using Value = std::variant<
    RawIdentifier, IntLit, FloatLit, BoolLit, NullLit, UndefLit,
    ZeroInitializerLit>;

inline auto SpanOf(const Value& value) -> SourceSpan {
  return std::visit([](const auto& v) { return v.span; }, value);
}

// `<type> <value>`, e.g. `i32 %x` or `i8 7`.
struct TypedValue {
  Type type;
  Value value;
  SourceSpan span{};
};

// --- Attributes --------------------------------------------------------------

// `ccc`, `fastcc`, `amdgpu_kernel`, ...
struct CallingConvEnum {
  Keyword keyword;
};

// `cc 11`
struct CallingConvInt {
  UintLit code;
  SourceSpan span{};
};

using CallingConv = std::variant<CallingConvEnum, CallingConvInt>;

// `thread_local` or `thread_local(initialexec)`
struct ThreadLocal {
  std::optional<Keyword> model;
  SourceSpan span{};
};

// `addrspace(N)`
struct AddrSpace {
  UintLit n;
  SourceSpan span{};
};

// `comdat` or `comdat($name)`
struct ComdatRef {
  std::optional<RawIdentifier> name;
  SourceSpan span{};
};

// --- Instructions ------------------------------------------------------------

// `[ <value>, %pred ]`
struct Incoming {
  Value x;
  RawIdentifier pred;
  SourceSpan span{};
};

// `phi <type> [x0, %pred0], [x1, %pred1], ...`
struct PhiInst {
  Type type;
  std::vector<Incoming> incomings;
};

// `add nuw nsw i32 %a, %b`, `udiv exact i32 %a, 4`, ...
struct BinaryInst {
  Keyword opcode;
  std::vector<Keyword> overflow_flags;
  std::optional<Keyword> exact;
  Type type;
  Value x;
  Value y;
};

// `icmp slt i32 %a, %b`
struct ICmpInst {
  Keyword pred;
  Type type;
  Value x;
  Value y;
};

// `fcmp nnan ninf olt double %a, %b`
struct FCmpInst {
  std::vector<Keyword> fast_math_flags;
  Keyword pred;
  Type type;
  Value x;
  Value y;
};

// `tail call fastcc i32 @f(i32 1, ptr %p)`
struct CallInst {
  std::optional<Keyword> tail;
  std::optional<CallingConv> calling_conv;
  Type return_type;
  Value callee;
  std::vector<TypedValue> args;
};

// `atomicrmw volatile add ptr %p, i32 1 seq_cst`
struct AtomicRMWInst {
  std::optional<Keyword> is_volatile;
  Keyword op;
  TypedValue ptr;
  TypedValue x;
  Keyword ordering;
};

// `fence acquire`
struct FenceInst {
  Keyword ordering;
};

struct Instruction {
  std::optional<RawIdentifier> name;
  std::variant<
      PhiInst, BinaryInst, ICmpInst, FCmpInst, CallInst, AtomicRMWInst,
      FenceInst>
      inst;
  SourceSpan span{};
};

// --- Terminators -------------------------------------------------------------

// `ret void` or `ret <type> <value>`
struct RetTerm {
  std::optional<TypedValue> value;
};

// `br label %target`
struct BrTerm {
  RawIdentifier target;
};

// `br i1 %cond, label %t, label %f`
struct CondBrTerm {
  TypedValue cond;
  RawIdentifier target_true;
  RawIdentifier target_false;
};

// One switch arm: `<type> <const>, label %target`
struct Case {
  TypedValue x;
  RawIdentifier target;
  SourceSpan span{};
};

// `switch i32 %x, label %default [ i32 0, label %a ... ]`
struct SwitchTerm {
  TypedValue x;
  RawIdentifier default_target;
  std::vector<Case> cases;
};

struct UnreachableTerm {};

struct Terminator {
  std::variant<RetTerm, BrTerm, CondBrTerm, SwitchTerm, UnreachableTerm> term;
  SourceSpan span{};
};

// --- Top-level entities ------------------------------------------------------

struct BasicBlock {
  std::optional<RawIdentifier> label;
  std::vector<Instruction> insts;
  Terminator term;
  SourceSpan span{};
};

struct Param {
  Type type;
  std::optional<RawIdentifier> name;
  SourceSpan span{};
};

struct FunctionHeader {
  std::optional<Keyword> linkage;
  std::optional<Keyword> preemption;
  std::optional<Keyword> visibility;
  std::optional<Keyword> dll_storage_class;
  std::optional<CallingConv> calling_conv;
  Type return_type;
  RawIdentifier name;
  std::vector<Param> params;
  std::optional<Keyword> variadic;
  std::optional<Keyword> unnamed_addr;
  std::optional<AddrSpace> addr_space;
  std::optional<StringLit> section;
  std::optional<ComdatRef> comdat;
  std::optional<UintLit> align;
};

// `declare` when body is empty, `define` otherwise.
struct Function {
  FunctionHeader header;
  std::optional<std::vector<BasicBlock>> body;
  SourceSpan span{};
};

// `@g = [linkage] ... [thread_local(...)] ... global|constant <type> [init]`
struct GlobalDecl {
  RawIdentifier name;
  std::optional<Keyword> linkage;
  std::optional<Keyword> preemption;
  std::optional<Keyword> visibility;
  std::optional<Keyword> dll_storage_class;
  std::optional<ThreadLocal> thread_local_storage;
  std::optional<Keyword> unnamed_addr;
  std::optional<AddrSpace> addr_space;
  std::optional<Keyword> externally_initialized;
  Keyword immutable;
  Type content_type;
  std::optional<Value> init;
  std::optional<StringLit> section;
  std::optional<ComdatRef> comdat;
  std::optional<UintLit> align;
  SourceSpan span{};
};

// `$name = comdat <selection kind>`
struct ComdatDef {
  RawIdentifier name;
  std::optional<Keyword> selection_kind;
  SourceSpan span{};
};

using TopLevelEntity = std::variant<ComdatDef, GlobalDecl, Function>;

struct Module {
  std::optional<StringLit> source_filename;
  std::vector<TopLevelEntity> entities;
};

}  // namespace llasm::ast

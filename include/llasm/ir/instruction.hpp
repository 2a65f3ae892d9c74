#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "llasm/ir/enums.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/type.hpp"
#include "llasm/ir/value.hpp"

namespace llasm::ir {

struct PhiInst {
  std::vector<Incoming> incomings;
};

struct BinaryInst {
  BinaryOpcode opcode = BinaryOpcode::kAdd;
  OverflowFlags overflow_flags;
  bool exact = false;
  Operand x;
  Operand y;
};

struct ICmpInst {
  IPred pred = IPred::kEq;
  Operand x;
  Operand y;
};

struct FCmpInst {
  FastMathFlags fast_math_flags;
  FPred pred = FPred::kFalse;
  Operand x;
  Operand y;
};

struct CallInst {
  Tail tail = Tail::kNone;
  CallingConv calling_conv = CallingConv::kNone;
  Operand callee;
  std::vector<Operand> args;
};

struct AtomicRMWInst {
  bool is_volatile = false;
  AtomicOp op = AtomicOp::kXchg;
  Operand ptr;
  Operand x;
  AtomicOrdering ordering = AtomicOrdering::kNone;
};

struct FenceInst {
  AtomicOrdering ordering = AtomicOrdering::kNone;
};

// Reserved slot: the instruction was declared (name and result type known)
// but its body has not been lowered yet.
struct PendingInst {};

using InstPayload = std::variant<
    PendingInst, PhiInst, BinaryInst, ICmpInst, FCmpInst, CallInst,
    AtomicRMWInst, FenceInst>;

struct Instruction {
  // Empty for unnamed instructions.
  std::string name;
  TypeId type;
  BlockId parent;
  InstPayload payload;

  [[nodiscard]] auto IsPending() const -> bool {
    return std::holds_alternative<PendingInst>(payload);
  }
};

// --- Terminators -------------------------------------------------------------

struct RetTerm {
  std::optional<Operand> value;
};

struct BrTerm {
  BlockId target;
};

struct CondBrTerm {
  Operand cond;
  BlockId target_true;
  BlockId target_false;
};

struct SwitchTerm {
  Operand x;
  BlockId default_target;
  std::vector<Case> cases;
};

struct UnreachableTerm {};

struct PendingTerm {};

using Terminator = std::variant<
    PendingTerm, RetTerm, BrTerm, CondBrTerm, SwitchTerm, UnreachableTerm>;

}  // namespace llasm::ir

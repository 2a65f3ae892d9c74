#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llasm/common/internal_error.hpp"
#include "llasm/ir/enums.hpp"
#include "llasm/ir/ids.hpp"
#include "llasm/ir/instruction.hpp"
#include "llasm/ir/type.hpp"

namespace llasm::ir {

struct Param {
  std::string name;
  TypeId type;
};

struct BasicBlock {
  // Empty for unnamed blocks.
  std::string name;
  std::vector<InstId> insts;
  Terminator term;
};

struct Function {
  std::string name;
  Linkage linkage = Linkage::kNone;
  Preemption preemption = Preemption::kNone;
  Visibility visibility = Visibility::kNone;
  DllStorageClass dll_storage_class = DllStorageClass::kNone;
  CallingConv calling_conv = CallingConv::kNone;
  TypeId return_type;
  std::vector<Param> params;
  bool variadic = false;
  UnnamedAddr unnamed_addr = UnnamedAddr::kNone;
  uint32_t addr_space = 0;
  std::optional<std::string> section;
  std::optional<ComdatId> comdat;
  std::optional<uint64_t> align;

  std::vector<BasicBlock> blocks;
  std::vector<Instruction> insts;

  [[nodiscard]] auto IsDeclaration() const -> bool {
    return blocks.empty();
  }

  auto AddBlock(BasicBlock block) -> BlockId {
    BlockId id{static_cast<uint32_t>(blocks.size())};
    blocks.push_back(std::move(block));
    return id;
  }

  auto AddInst(Instruction inst) -> InstId {
    InstId id{static_cast<uint32_t>(insts.size())};
    insts.push_back(std::move(inst));
    return id;
  }

  [[nodiscard]] auto Block(BlockId id) const -> const BasicBlock& {
    if (id.value >= blocks.size()) {
      common::ThrowInternalError("Function::Block", "block id out of range");
    }
    return blocks[id.value];
  }

  [[nodiscard]] auto Inst(InstId id) const -> const Instruction& {
    if (id.value >= insts.size()) {
      common::ThrowInternalError("Function::Inst", "inst id out of range");
    }
    return insts[id.value];
  }

  auto MutableBlock(BlockId id) -> BasicBlock& {
    if (id.value >= blocks.size()) {
      common::ThrowInternalError(
          "Function::MutableBlock", "block id out of range");
    }
    return blocks[id.value];
  }

  auto MutableInst(InstId id) -> Instruction& {
    if (id.value >= insts.size()) {
      common::ThrowInternalError(
          "Function::MutableInst", "inst id out of range");
    }
    return insts[id.value];
  }
};

}  // namespace llasm::ir

#include "llasm/lowering/ast_to_ir/function_lowerer.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/ir/instruction.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/instruction.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

// `%7` / `7:` style names; nullopt for anything else.
auto ParseLocalId(const std::string& name) -> std::optional<uint32_t> {
  if (name.empty()) {
    return std::nullopt;
  }
  uint32_t id = 0;
  const char* end = name.data() + name.size();
  auto [ptr, ec] = std::from_chars(name.data(), end, id, 10);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return id;
}

// `%"7"` and `"7":` are ordinary names, not numbered ones.
auto IsQuoted(const ast::RawIdentifier& id) -> bool {
  std::string_view text = id.text;
  if (text.starts_with('%')) {
    text.remove_prefix(1);
  }
  return text.starts_with('"');
}

}  // namespace

FunctionLowerer::FunctionLowerer(
    Context* ctx, const ast::Function& node, ir::Function* func)
    : ctx_(ctx), node_(node), func_(func) {
}

auto FunctionLowerer::DeclareLocal(
    const std::optional<ast::RawIdentifier>& raw,
    const std::optional<std::string>& name, LocalEntity entity,
    SourceSpan span) -> Result<void> {
  if (!name) {
    return locals_.Declare(
        std::to_string(next_local_id_++),
        LocalSymbol{.entity = entity, .definition = span});
  }
  std::optional<uint32_t> id;
  if (raw && !IsQuoted(*raw)) {
    id = ParseLocalId(*name);
  }
  if (id) {
    if (*id != next_local_id_) {
      return std::unexpected(
          Diagnostic::Error(
              span, fmt::format(
                        "local identifier '%{}' expected to be numbered '%{}'",
                        *name, next_local_id_))
              .WithCode(DiagCode::kInvalidOperand, *name));
    }
    ++next_local_id_;
  }
  return locals_.Declare(
      *name, LocalSymbol{.entity = entity, .definition = span});
}

auto FunctionLowerer::DeclareLocals() -> Result<void> {
  if (locals_.IsSealed()) {
    throw common::InternalError(
        "FunctionLowerer::DeclareLocals",
        fmt::format("locals of '@{}' declared twice", func_->name));
  }
  if (node_.header.params.size() != func_->params.size()) {
    throw common::InternalError(
        "FunctionLowerer::DeclareLocals",
        fmt::format("header of '@{}' not lowered", func_->name));
  }

  for (size_t i = 0; i < node_.header.params.size(); ++i) {
    const auto& param = node_.header.params[i];
    auto declared = DeclareLocal(
        param.name, DecodeOptionalLocal(param.name),
        ir::ArgId{static_cast<uint32_t>(i)}, param.span);
    if (!declared) return std::unexpected(declared.error());
  }

  if (node_.body) {
    ir::TypeId void_type = ctx_->builtin_types.void_type;
    for (const auto& block : *node_.body) {
      std::optional<std::string> label = DecodeOptionalLabel(block.label);
      ir::BlockId block_id = func_->AddBlock(ir::BasicBlock{
          .name = label.value_or(""),
          .insts = {},
          .term = ir::PendingTerm{},
      });
      block_ids_.push_back(block_id);
      auto declared = DeclareLocal(block.label, label, block_id, block.span);
      if (!declared) return std::unexpected(declared.error());

      for (const auto& inst : block.insts) {
        auto type_or_err = InferResultType(inst, *ctx_);
        if (!type_or_err) return std::unexpected(type_or_err.error());
        bool is_void = *type_or_err == void_type;

        std::optional<std::string> name = DecodeOptionalLocal(inst.name);
        if (name && is_void) {
          return std::unexpected(
              Diagnostic::Error(
                  inst.name->span,
                  fmt::format(
                      "instruction returning void cannot be named '%{}'",
                      *name))
                  .WithCode(DiagCode::kInvalidOperand, *name));
        }

        ir::InstId inst_id = func_->AddInst(ir::Instruction{
            .name = name.value_or(""),
            .type = *type_or_err,
            .parent = block_id,
            .payload = ir::PendingInst{},
        });
        func_->MutableBlock(block_id).insts.push_back(inst_id);
        inst_ids_.push_back(inst_id);

        if (!is_void) {
          auto inst_declared = DeclareLocal(inst.name, name, inst_id, inst.span);
          if (!inst_declared) return std::unexpected(inst_declared.error());
        }
      }
    }
  }

  locals_.Seal();
  spdlog::debug(
      "declared {} locals in '@{}' ({} blocks, {} instructions)",
      locals_.Size(), func_->name, block_ids_.size(), inst_ids_.size());
  return {};
}

auto FunctionLowerer::LowerBodies() -> Result<void> {
  if (!locals_.IsSealed()) {
    throw common::InternalError(
        "FunctionLowerer::LowerBodies",
        fmt::format("locals of '@{}' not declared", func_->name));
  }
  if (!node_.body) {
    return {};
  }

  FunctionScope scope = Scope();
  size_t next_inst = 0;
  for (size_t b = 0; b < node_.body->size(); ++b) {
    const auto& block = (*node_.body)[b];
    for (const auto& inst : block.insts) {
      auto lowered = LowerInstruction(inst, inst_ids_[next_inst++], scope);
      if (!lowered) return std::unexpected(lowered.error());
    }
    auto term = LowerTerminator(block.term, block_ids_[b], scope);
    if (!term) return std::unexpected(term.error());
  }

  spdlog::debug("lowered body of '@{}'", func_->name);
  return {};
}

auto FunctionLowerer::Lower() -> Result<void> {
  auto declared = DeclareLocals();
  if (!declared) return std::unexpected(declared.error());
  return LowerBodies();
}

}  // namespace llasm::lowering::ast_to_ir

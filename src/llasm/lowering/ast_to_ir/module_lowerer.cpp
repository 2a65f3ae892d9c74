#include "llasm/lowering/ast_to_ir/module_lowerer.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "llasm/common/internal_error.hpp"
#include "llasm/common/overloaded.hpp"
#include "llasm/lowering/ast_to_ir/enum_resolver.hpp"
#include "llasm/lowering/ast_to_ir/function_lowerer.hpp"
#include "llasm/lowering/ast_to_ir/identifier.hpp"
#include "llasm/lowering/ast_to_ir/literal.hpp"
#include "llasm/lowering/ast_to_ir/type.hpp"

namespace llasm::lowering::ast_to_ir {

namespace {

// Global variables without an initializer are declarations and may only
// have external linkage.
auto IsDeclarationLinkage(ir::Linkage linkage) -> bool {
  return linkage == ir::Linkage::kNone || linkage == ir::Linkage::kExternal ||
         linkage == ir::Linkage::kExternWeak;
}

auto IsFirstClass(const ir::Type& type) -> bool {
  return !type.IsVoid() && !type.IsLabel();
}

auto DecodeOptionalSection(const std::optional<ast::StringLit>& section)
    -> std::optional<std::string> {
  if (!section) {
    return std::nullopt;
  }
  return DecodeString(*section).text;
}

}  // namespace

ModuleLowerer::ModuleLowerer(
    const ast::Module& node, DiagnosticSink& sink,
    const LoweringOptions& options)
    : node_(node),
      sink_(sink),
      options_(options),
      ctx_{
          .module = &module_,
          .globals = &globals_,
          .constant_lowerer = &constant_lowerer_,
          .builtin_types = InternBuiltinTypes(module_.types),
      },
      entity_index_(node.entities.size()) {
}

auto ModuleLowerer::Lower() -> ir::Module {
  if (lowered_) {
    throw common::InternalError("ModuleLowerer::Lower", "module lowered twice");
  }
  lowered_ = true;

  if (node_.source_filename) {
    module_.source_filename = DecodeString(*node_.source_filename).text;
  }

  spdlog::debug(
      "lowering module '{}' ({} top-level entities)", module_.source_filename,
      node_.entities.size());
  DeclareEntities();
  spdlog::debug(
      "declared {} globals, {} functions, {} comdats", module_.globals.size(),
      module_.functions.size(), module_.comdats.size());
  if (!stopped_) {
    LowerDefinitions();
  }
  if (stopped_) {
    spdlog::warn(
        "lowering stopped after {} error(s); remaining entities skipped",
        error_count_);
  }
  return std::move(module_);
}

void ModuleLowerer::Fail(Diagnostic diag) {
  sink_.Report(std::move(diag));
  ++error_count_;
  if (!options_.keep_going) {
    stopped_ = true;
  }
  if (options_.max_errors != 0 && error_count_ >= options_.max_errors) {
    stopped_ = true;
  }
}

void ModuleLowerer::DeclareEntities() {
  // Comdats first: globals and functions refer to them by name.
  for (const auto& entity : node_.entities) {
    if (stopped_) {
      return;
    }
    const auto* comdat = std::get_if<ast::ComdatDef>(&entity);
    if (comdat == nullptr) {
      continue;
    }
    auto lowered = LowerComdat(*comdat);
    if (!lowered) Fail(std::move(lowered.error()));
  }

  for (size_t i = 0; i < node_.entities.size(); ++i) {
    if (stopped_) {
      return;
    }
    auto declared = std::visit(
        Overloaded{
            [](const ast::ComdatDef& /*node*/) -> Result<void> { return {}; },
            [&](const ast::GlobalDecl& node) { return DeclareGlobal(node, i); },
            [&](const ast::Function& node) { return DeclareFunction(node, i); },
        },
        node_.entities[i]);
    if (!declared) Fail(std::move(declared.error()));
  }
}

void ModuleLowerer::LowerDefinitions() {
  for (size_t i = 0; i < node_.entities.size(); ++i) {
    if (stopped_) {
      return;
    }
    if (!entity_index_[i]) {
      continue;
    }
    uint32_t index = *entity_index_[i];
    auto lowered = std::visit(
        Overloaded{
            [](const ast::ComdatDef& /*node*/) -> Result<void> { return {}; },
            [&](const ast::GlobalDecl& node) {
              return LowerGlobalInit(node, index);
            },
            [&](const ast::Function& node) -> Result<void> {
              FunctionLowerer lowerer(&ctx_, node, &module_.functions[index]);
              return lowerer.Lower();
            },
        },
        node_.entities[i]);
    if (!lowered) Fail(std::move(lowered.error()));
  }
}

auto ModuleLowerer::LowerComdat(const ast::ComdatDef& node) -> Result<void> {
  std::string name = DecodeComdatName(node.name);
  ir::ComdatId id{static_cast<uint32_t>(module_.comdats.size())};
  auto declared = globals_.DeclareComdat(name, id, node.name.span);
  if (!declared) return std::unexpected(declared.error());

  module_.comdats.push_back(
      ir::Comdat{
          .name = std::move(name),
          .selection_kind = ResolveOptionalSelectionKind(node.selection_kind),
      });
  return {};
}

auto ModuleLowerer::LowerComdatRef(
    const std::optional<ast::ComdatRef>& node, const std::string& owner)
    -> Result<std::optional<ir::ComdatId>> {
  if (!node) {
    return std::optional<ir::ComdatId>{};
  }
  std::string name = node->name ? DecodeComdatName(*node->name) : owner;
  auto id_or_err = globals_.ResolveComdat(name, node->span);
  if (!id_or_err) return std::unexpected(id_or_err.error());
  return std::optional<ir::ComdatId>{*id_or_err};
}

auto ModuleLowerer::DeclareGlobal(const ast::GlobalDecl& node, size_t entity)
    -> Result<void> {
  std::string name = DecodeGlobal(node.name);
  auto index = static_cast<uint32_t>(module_.globals.size());
  auto declared = globals_.Declare(
      name, ir::GlobalRef{.kind = ir::GlobalKind::kVariable, .index = index},
      node.name.span);
  if (!declared) return std::unexpected(declared.error());
  // Registered before the header is lowered so that uses of a global with a
  // broken header do not cascade into unresolved-name errors.
  module_.globals.push_back(ir::GlobalVariable{.name = name});

  ir::GlobalVariable global{
      .name = name,
      .linkage = ResolveOptionalLinkage(node.linkage),
      .preemption = ResolveOptionalPreemption(node.preemption),
      .visibility = ResolveOptionalVisibility(node.visibility),
      .dll_storage_class =
          ResolveOptionalDllStorageClass(node.dll_storage_class),
      .tls_model = ResolveThreadLocal(node.thread_local_storage),
      .unnamed_addr = ResolveOptionalUnnamedAddr(node.unnamed_addr),
      .addr_space = 0,
      .externally_initialized = DecodeFlag(node.externally_initialized),
      .immutable = ResolveImmutable(node.immutable),
      .content_type = ir::kInvalidTypeId,
      .init = std::nullopt,
      .section = DecodeOptionalSection(node.section),
      .comdat = std::nullopt,
      .align = std::nullopt,
  };

  auto as_or_err = DecodeOptionalAddrSpace(node.addr_space);
  if (!as_or_err) return std::unexpected(as_or_err.error());
  global.addr_space = *as_or_err;
  // The address type of a global is fixed by pass 1.
  module_.globals[index].addr_space = global.addr_space;

  auto type_or_err = LowerType(node.content_type, ctx_);
  if (!type_or_err) return std::unexpected(type_or_err.error());
  if (!IsFirstClass(module_.types[*type_or_err])) {
    return std::unexpected(
        Diagnostic::Error(
            node.content_type.span,
            fmt::format(
                "invalid type '{}' for global variable '@{}'",
                node.content_type.text, name))
            .WithCode(DiagCode::kInvalidType, node.content_type.text));
  }
  global.content_type = *type_or_err;

  if (!node.init && !IsDeclarationLinkage(global.linkage)) {
    return std::unexpected(
        Diagnostic::Error(
            node.linkage ? node.linkage->span : node.span,
            fmt::format(
                "invalid linkage '{}' for global declaration '@{}'",
                ir::ToString(global.linkage), name))
            .WithCode(DiagCode::kInvalidOperand, name));
  }

  auto comdat_or_err = LowerComdatRef(node.comdat, name);
  if (!comdat_or_err) return std::unexpected(comdat_or_err.error());
  global.comdat = *comdat_or_err;

  auto align_or_err = DecodeOptionalAlignment(node.align);
  if (!align_or_err) return std::unexpected(align_or_err.error());
  global.align = *align_or_err;

  module_.globals[index] = std::move(global);
  entity_index_[entity] = index;
  return {};
}

auto ModuleLowerer::DeclareFunction(const ast::Function& node, size_t entity)
    -> Result<void> {
  const auto& header = node.header;
  std::string name = DecodeGlobal(header.name);
  auto index = static_cast<uint32_t>(module_.functions.size());
  auto declared = globals_.Declare(
      name, ir::GlobalRef{.kind = ir::GlobalKind::kFunction, .index = index},
      header.name.span);
  if (!declared) return std::unexpected(declared.error());
  module_.functions.push_back(ir::Function{.name = name});

  auto cc_or_err = ResolveOptionalCallingConv(header.calling_conv);
  if (!cc_or_err) return std::unexpected(cc_or_err.error());

  ir::Function func{
      .name = name,
      .linkage = ResolveOptionalLinkage(header.linkage),
      .preemption = ResolveOptionalPreemption(header.preemption),
      .visibility = ResolveOptionalVisibility(header.visibility),
      .dll_storage_class =
          ResolveOptionalDllStorageClass(header.dll_storage_class),
      .calling_conv = *cc_or_err,
      .return_type = ir::kInvalidTypeId,
      .params = {},
      .variadic = DecodeFlag(header.variadic),
      .unnamed_addr = ResolveOptionalUnnamedAddr(header.unnamed_addr),
      .addr_space = 0,
      .section = DecodeOptionalSection(header.section),
      .comdat = std::nullopt,
      .align = std::nullopt,
      .blocks = {},
      .insts = {},
  };

  auto as_or_err = DecodeOptionalAddrSpace(header.addr_space);
  if (!as_or_err) return std::unexpected(as_or_err.error());
  func.addr_space = *as_or_err;
  module_.functions[index].addr_space = func.addr_space;

  auto ret_or_err = LowerType(header.return_type, ctx_);
  if (!ret_or_err) return std::unexpected(ret_or_err.error());
  if (module_.types[*ret_or_err].IsLabel()) {
    return std::unexpected(
        Diagnostic::Error(
            header.return_type.span,
            fmt::format("invalid return type 'label' for function '@{}'", name))
            .WithCode(DiagCode::kInvalidType, header.return_type.text));
  }
  func.return_type = *ret_or_err;

  func.params.reserve(header.params.size());
  for (const auto& param : header.params) {
    auto type_or_err = LowerType(param.type, ctx_);
    if (!type_or_err) return std::unexpected(type_or_err.error());
    if (!IsFirstClass(module_.types[*type_or_err])) {
      return std::unexpected(
          Diagnostic::Error(
              param.type.span,
              fmt::format(
                  "invalid parameter type '{}' for function '@{}'",
                  param.type.text, name))
              .WithCode(DiagCode::kInvalidType, param.type.text));
    }
    func.params.push_back(
        ir::Param{
            .name = DecodeOptionalLocal(param.name).value_or(""),
            .type = *type_or_err,
        });
  }

  auto comdat_or_err = LowerComdatRef(header.comdat, name);
  if (!comdat_or_err) return std::unexpected(comdat_or_err.error());
  func.comdat = *comdat_or_err;

  auto align_or_err = DecodeOptionalAlignment(header.align);
  if (!align_or_err) return std::unexpected(align_or_err.error());
  func.align = *align_or_err;

  module_.functions[index] = std::move(func);
  entity_index_[entity] = index;
  return {};
}

auto ModuleLowerer::LowerGlobalInit(
    const ast::GlobalDecl& node, uint32_t index) -> Result<void> {
  if (!node.init) {
    return {};
  }
  ir::TypeId type = module_.globals[index].content_type;
  auto init_or_err = constant_lowerer_.LowerConstant(type, *node.init, ctx_);
  if (!init_or_err) {
    return std::unexpected(
        std::move(init_or_err.error())
            .WithNote(
                node.name.span,
                fmt::format(
                    "in initializer of '@{}'", module_.globals[index].name)));
  }
  module_.globals[index].init = *init_or_err;
  return {};
}

}  // namespace llasm::lowering::ast_to_ir

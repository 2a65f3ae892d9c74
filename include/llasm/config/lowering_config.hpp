#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/lowering/ast_to_ir/options.hpp"

namespace llasm::config {

inline constexpr std::string_view kConfigFileName = "llasm.toml";

struct LoweringConfig {
  lowering::ast_to_ir::LoweringOptions lowering;
  spdlog::level::level_enum log_level = spdlog::level::info;

  // Directory where llasm.toml was found
  std::filesystem::path root_dir;
};

// Search for llasm.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse llasm.toml. Every section and key is optional; parse errors, wrong
// value types and unknown log levels are host errors.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<LoweringConfig>;

// Same, from TOML text; `source` names the text in diagnostics.
auto ParseConfig(std::string_view text, std::string_view source = "<string>")
    -> Result<LoweringConfig>;

// Sets the default spdlog logger to the configured level.
void ApplyLogLevel(const LoweringConfig& config);

}  // namespace llasm::config

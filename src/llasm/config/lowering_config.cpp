#include "llasm/config/lowering_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#endif

namespace llasm::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(std::string_view source, std::string_view detail)
    -> Diagnostic {
  return Diagnostic::HostError(fmt::format("{}: {}", source, detail))
      .WithCode(DiagCode::kConfig, std::string(source));
}

auto ParseLogLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum> {
  // spdlog maps unknown names to `off`; only accept the names it prints.
  auto level = spdlog::level::from_str(std::string(text));
  if (level == spdlog::level::off && text != "off") {
    return std::nullopt;
  }
  return level;
}

auto FromTable(const toml::table& tbl, std::string_view source)
    -> Result<LoweringConfig> {
  LoweringConfig config;

  // [lowering] section (optional)
  if (const auto* lowering = tbl["lowering"].as_table()) {
    if (const auto* node = lowering->get("max_errors")) {
      auto max_errors = node->value<int64_t>();
      if (!max_errors || *max_errors < 0) {
        return std::unexpected(ConfigError(
            source, "'lowering.max_errors' must be a non-negative integer"));
      }
      config.lowering.max_errors = static_cast<size_t>(*max_errors);
    }
    if (const auto* node = lowering->get("keep_going")) {
      auto keep_going = node->value<bool>();
      if (!keep_going) {
        return std::unexpected(
            ConfigError(source, "'lowering.keep_going' must be a boolean"));
      }
      config.lowering.keep_going = *keep_going;
    }
  }

  // [log] section (optional)
  if (const auto* log = tbl["log"].as_table()) {
    if (const auto* node = log->get("level")) {
      auto text = node->value<std::string>();
      if (!text) {
        return std::unexpected(
            ConfigError(source, "'log.level' must be a string"));
      }
      auto level = ParseLogLevel(*text);
      if (!level) {
        return std::unexpected(ConfigError(
            source,
            fmt::format(
                "unknown log level '{}'; expected one of trace, debug, info, "
                "warn, error, critical, off",
                *text)));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<LoweringConfig> {
  std::string source = config_path.string();
  toml::table tbl;
  try {
    tbl = toml::parse_file(source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(ConfigError(
        source, fmt::format("failed to parse: {}", e.description())));
  }

  auto config_or_err = FromTable(tbl, source);
  if (!config_or_err) return std::unexpected(config_or_err.error());
  config_or_err->root_dir = config_path.parent_path();
  return config_or_err;
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<LoweringConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(ConfigError(
        source, fmt::format("failed to parse: {}", e.description())));
  }
  return FromTable(tbl, source);
}

void ApplyLogLevel(const LoweringConfig& config) {
  spdlog::set_level(config.log_level);
}

}  // namespace llasm::config

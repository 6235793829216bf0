#pragma once

#include <cowgnition/config/app_config.hpp>
#include <cowgnition/core/result.hpp>

#include <string_view>

namespace cowgnition {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. A leading "serve" command is
// accepted and ignored.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from the defaults
// replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides);

// Apply COWGNITION_SCHEMA_URI, COWGNITION_LOG_LEVEL and COWGNITION_TRANSPORT.
AppConfig ApplyEnvOverrides(AppConfig config);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Defaults < YAML (when --config is given) < environment < CLI.
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv);

} // namespace cowgnition

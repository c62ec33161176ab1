#pragma once

#include <mcpfs/config/app_config.hpp>
#include <mcpfs/core/log.hpp>
#include <mcpfs/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpfs {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse option flags into an AppConfig. `argv` holds the program name and
// flags only; the subcommand and its positionals are split off beforehand.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// A CLI field still at its built-in default does not override YAML.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill what neither YAML nor CLI set: MCPFS_ROOT and MCPFS_LOG_LEVEL from the
// environment, then the current directory as sandbox root.
Result<AppConfig, Error> ResolveEnvDefaults(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Split a shell-like command string on whitespace; single and double quotes
// group words. Used for --server-command and a scalar `client.command`.
Result<std::vector<std::string>, Error> SplitCommandString(std::string_view command);

// Effective log level: -q, then -v/-vv, then log_level, else warn.
LogLevel EffectiveLogLevel(const AppConfig& config);

} // namespace mcpfs

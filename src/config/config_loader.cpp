#include <mcpfs/config/config_loader.hpp>

#include <mcpfs/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace mcpfs {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", "", message);
}

template <typename T>
Result<T, Error> PositiveSize(long long value, const std::string& flag) {
    if (value <= 0) {
        return Result<T, Error>::Err(
            MakeConfigError(flag + " must be positive, got " + std::to_string(value)));
    }
    return Result<T, Error>::Ok(static_cast<T>(value));
}

void LoadServerSection(const YAML::Node& node, ServerConfig& server) {
    if (node["root"]) {
        server.sandbox_root = node["root"].as<std::string>();
    }
    if (node["workers"]) {
        server.max_workers = node["workers"].as<std::size_t>();
    }
    if (node["max_frame_bytes"]) {
        server.max_frame_bytes = node["max_frame_bytes"].as<std::size_t>();
    }
    if (node["max_file_bytes"]) {
        server.max_file_bytes = node["max_file_bytes"].as<std::size_t>();
    }
    if (node["name"]) {
        server.server_name = node["name"].as<std::string>();
    }
}

Result<void, Error> LoadClientSection(const YAML::Node& node, ClientConfig& client) {
    if (node["command"]) {
        const auto& cmd = node["command"];
        if (cmd.IsSequence()) {
            client.command.clear();
            for (const auto& part : cmd) {
                client.command.push_back(part.as<std::string>());
            }
        } else {
            auto split = SplitCommandString(cmd.as<std::string>());
            if (split.IsErr()) return Result<void, Error>::Err(split.Error());
            client.command = std::move(split).Value();
        }
    }
    if (node["call_timeout_ms"]) {
        client.call_timeout_ms = node["call_timeout_ms"].as<int>();
    }
    if (node["startup_timeout_ms"]) {
        client.startup_timeout_ms = node["startup_timeout_ms"].as<int>();
    }
    if (node["shutdown_grace_ms"]) {
        client.shutdown_grace_ms = node["shutdown_grace_ms"].as<int>();
    }
    if (node["max_frame_bytes"]) {
        client.max_frame_bytes = node["max_frame_bytes"].as<std::size_t>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_path = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root.IsDefined() || root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config file must contain a mapping: " +
                                std::string(file_path)));
        }

        // -- Server --
        if (root["server"]) {
            LoadServerSection(root["server"], config.server);
        }

        // -- Client --
        if (root["client"]) {
            auto client = LoadClientSection(root["client"], config.client);
            if (client.IsErr()) {
                return Result<AppConfig, Error>::Err(client.Error());
            }
        }

        // -- Options --
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    AppConfig config;

    // -v / -vv are counted here; argparse would reject a repeated flag.
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (i > 0 && (arg == "-v" || arg == "--verbose")) {
            config.verbosity += 1;
            continue;
        }
        if (i > 0 && arg == "-vv") {
            config.verbosity += 2;
            continue;
        }
        args.emplace_back(arg);
    }
    if (args.empty()) args.emplace_back("mcpfs");

    argparse::ArgumentParser program("mcpfs", kVersion,
                                     argparse::default_arguments::none);

    // Server flags
    program.add_argument("--root")
        .help("Sandbox root directory");
    program.add_argument("--workers")
        .help("Concurrent tool handlers")
        .scan<'i', long long>();
    program.add_argument("--max-frame-bytes")
        .help("Largest accepted protocol frame")
        .scan<'i', long long>();
    program.add_argument("--max-file-bytes")
        .help("Largest file read_file returns")
        .scan<'i', long long>();

    // Client flags
    program.add_argument("--server-command")
        .help("Command line of the server subprocess");
    program.add_argument("--timeout")
        .help("Tool call timeout in milliseconds")
        .scan<'i', int>();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-logs")
        .help("Log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    // Server
    if (auto val = program.present("--root")) {
        config.server.sandbox_root = *val;
    }
    if (auto val = program.present<long long>("--workers")) {
        auto n = PositiveSize<std::size_t>(*val, "--workers");
        if (n.IsErr()) return Result<AppConfig, Error>::Err(n.Error());
        config.server.max_workers = n.Value();
    }
    if (auto val = program.present<long long>("--max-frame-bytes")) {
        auto n = PositiveSize<std::size_t>(*val, "--max-frame-bytes");
        if (n.IsErr()) return Result<AppConfig, Error>::Err(n.Error());
        config.server.max_frame_bytes = n.Value();
        config.client.max_frame_bytes = n.Value();
    }
    if (auto val = program.present<long long>("--max-file-bytes")) {
        auto n = PositiveSize<std::size_t>(*val, "--max-file-bytes");
        if (n.IsErr()) return Result<AppConfig, Error>::Err(n.Error());
        config.server.max_file_bytes = n.Value();
    }

    // Client
    if (auto val = program.present("--server-command")) {
        auto split = SplitCommandString(*val);
        if (split.IsErr()) return Result<AppConfig, Error>::Err(split.Error());
        config.client.command = std::move(split).Value();
    }
    if (auto val = program.present<int>("--timeout")) {
        config.client.call_timeout_ms = *val;
    }

    // Options
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    // Server overrides
    if (!cli_overrides.server.sandbox_root.empty()) {
        merged.server.sandbox_root = cli_overrides.server.sandbox_root;
    }
    if (cli_overrides.server.max_workers != defaults.server.max_workers) {
        merged.server.max_workers = cli_overrides.server.max_workers;
    }
    if (cli_overrides.server.max_frame_bytes != defaults.server.max_frame_bytes) {
        merged.server.max_frame_bytes = cli_overrides.server.max_frame_bytes;
    }
    if (cli_overrides.server.max_file_bytes != defaults.server.max_file_bytes) {
        merged.server.max_file_bytes = cli_overrides.server.max_file_bytes;
    }

    // Client overrides
    if (!cli_overrides.client.command.empty()) {
        merged.client.command = cli_overrides.client.command;
    }
    if (cli_overrides.client.call_timeout_ms != defaults.client.call_timeout_ms) {
        merged.client.call_timeout_ms = cli_overrides.client.call_timeout_ms;
    }
    if (cli_overrides.client.max_frame_bytes != defaults.client.max_frame_bytes) {
        merged.client.max_frame_bytes = cli_overrides.client.max_frame_bytes;
    }

    // Options
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvDefaults
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvDefaults(AppConfig config) {
    if (config.server.sandbox_root.empty()) {
        const char* env_root = std::getenv("MCPFS_ROOT");
        if (env_root != nullptr && *env_root != '\0') {
            config.server.sandbox_root = env_root;
        } else {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (ec) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Cannot determine current directory: " + ec.message()));
            }
            config.server.sandbox_root = cwd.string();
        }
    }
    if (!config.log_level.has_value()) {
        const char* env_level = std::getenv("MCPFS_LOG_LEVEL");
        if (env_level != nullptr && *env_level != '\0') {
            config.log_level = std::string(env_level);
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.sandbox_root.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.root"));
    }
    if (config.server.max_workers == 0) {
        return Result<void, Error>::Err(MakeConfigError("server.workers must be positive"));
    }
    if (config.server.max_frame_bytes == 0 || config.client.max_frame_bytes == 0) {
        return Result<void, Error>::Err(MakeConfigError("max_frame_bytes must be positive"));
    }
    if (config.server.max_file_bytes == 0) {
        return Result<void, Error>::Err(MakeConfigError("server.max_file_bytes must be positive"));
    }
    if (config.client.call_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.client.call_timeout_ms)));
    }
    if (config.client.startup_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("client.startup_timeout_ms must be positive"));
    }
    if (config.client.shutdown_grace_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("client.shutdown_grace_ms must not be negative"));
    }
    if (!config.client.command.empty() && config.client.command.front().empty()) {
        return Result<void, Error>::Err(MakeConfigError("client.command has an empty program"));
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + *config.log_level));
    }
    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// SplitCommandString
// ---------------------------------------------------------------------------
Result<std::vector<std::string>, Error> SplitCommandString(std::string_view command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    if (quote != '\0') {
        return Result<std::vector<std::string>, Error>::Err(
            MakeConfigError("Unterminated quote in command: " + std::string(command)));
    }
    if (in_word) words.push_back(std::move(current));
    if (words.empty()) {
        return Result<std::vector<std::string>, Error>::Err(
            MakeConfigError("Server command must not be empty"));
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(words));
}

// ---------------------------------------------------------------------------
// EffectiveLogLevel
// ---------------------------------------------------------------------------
LogLevel EffectiveLogLevel(const AppConfig& config) {
    if (config.quiet) return LogLevel::Error;
    if (config.verbosity >= 2) return LogLevel::Debug;
    if (config.verbosity == 1) return LogLevel::Info;
    if (config.log_level.has_value()) {
        if (auto level = ParseLogLevel(*config.log_level)) return *level;
    }
    return LogLevel::Warn;
}

} // namespace mcpfs

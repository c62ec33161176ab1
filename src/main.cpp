#include <mcpfs/cli/command_line.hpp>
#include <mcpfs/cli/output_formatter.hpp>
#include <mcpfs/client/mcp_client.hpp>
#include <mcpfs/client/tool_adapter.hpp>
#include <mcpfs/config/config_loader.hpp>
#include <mcpfs/core/log.hpp>
#include <mcpfs/core/terminal.hpp>
#include <mcpfs/core/version.hpp>
#include <mcpfs/mcp/fs_tool_handlers.hpp>
#include <mcpfs/mcp/mcp_server.hpp>
#include <mcpfs/sandbox/path_sandbox.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

using namespace mcpfs;

constexpr int kExitUsage = 2;

// Path of the running binary, so the client can spawn itself as server.
std::string SelfExecutable(const char* argv0) {
    char buf[4096];
    auto n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0) {
        buf[n] = '\0';
        return buf;
    }
    return argv0;
}

Result<void, Error> InitLogging(const AppConfig& config) {
    std::unique_ptr<ILogSink> sink;
    if (config.log_file.has_value()) {
        try {
            sink = std::make_unique<FileSink>(*config.log_file);
        } catch (const std::exception& e) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Config, "InitLogging", *config.log_file, e.what()));
        }
    } else if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        bool force_color = config.color.has_value() && *config.color;
        bool force_no_color = config.color.has_value() && !*config.color;
        sink = std::make_unique<ColorConsoleSink>(
            ResolveColor(STDERR_FILENO, force_color, force_no_color));
    }
    InitGlobalLogger(std::move(sink), EffectiveLogLevel(config));
    return Result<void, Error>::Ok();
}

// Default client command: this binary as `serve`, with the same sandbox and
// limits.
std::vector<std::string> DefaultServerCommand(const AppConfig& config,
                                              const char* argv0) {
    const AppConfig defaults;
    std::vector<std::string> command = {
        SelfExecutable(argv0), "serve",
        "--root", config.server.sandbox_root,
        "--log-level", LogLevelName(EffectiveLogLevel(config)),
    };
    if (config.server.max_workers != defaults.server.max_workers) {
        command.push_back("--workers");
        command.push_back(std::to_string(config.server.max_workers));
    }
    if (config.server.max_file_bytes != defaults.server.max_file_bytes) {
        command.push_back("--max-file-bytes");
        command.push_back(std::to_string(config.server.max_file_bytes));
    }
    if (config.server.max_frame_bytes != defaults.server.max_frame_bytes) {
        command.push_back("--max-frame-bytes");
        command.push_back(std::to_string(config.server.max_frame_bytes));
    }
    return command;
}

std::string DescribeParameters(const ToolDescriptor& descriptor) {
    std::string out;
    for (const auto& p : descriptor.parameters) {
        if (!out.empty()) out += ", ";
        out += p.name;
        if (!p.required) out += "?";
        out += ":";
        out += ParamTypeName(p.type);
    }
    return out;
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

// ---------------------------------------------------------------------------
// Subcommands
// ---------------------------------------------------------------------------

int RunServe(const AppConfig& config, const OutputFormatter& fmt) {
    auto sandbox = PathSandbox::Create(config.server.sandbox_root);
    if (sandbox.IsErr()) return Fail(fmt, sandbox.Error());

    ToolRegistry registry;
    FsToolOptions fs_options;
    fs_options.max_file_bytes = config.server.max_file_bytes;
    auto registered = RegisterFilesystemTools(registry, sandbox.Value(), fs_options);
    if (registered.IsErr()) return Fail(fmt, registered.Error());

    LogInfo("main", "Sandbox root: " + sandbox.Value().Root().string());

    ServerOptions options;
    options.max_workers = config.server.max_workers;
    options.max_frame_bytes = config.server.max_frame_bytes;
    options.server_name = config.server.server_name;

    // Stdout carries protocol frames only from here on.
    McpServer server(std::move(registry), options);
    server.Run();
    return 0;
}

int RunTools(const AppConfig& config, const OutputFormatter& fmt) {
    auto client = McpClient::Start(config.client);
    if (client.IsErr()) return Fail(fmt, client.Error());

    auto tools = client.Value()->ListTools();
    client.Value()->Shutdown();
    if (tools.IsErr()) return Fail(fmt, tools.Error());

    if (fmt.IsJsonMode()) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& t : tools.Value()) {
            array.push_back(t.ToJson());
        }
        fmt.PrintJson(array.dump());
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& t : tools.Value()) {
        rows.push_back({t.name, DescribeParameters(t), t.description});
    }
    fmt.PrintTable({"TOOL", "PARAMETERS", "DESCRIPTION"}, rows);
    return 0;
}

int RunCall(const AppConfig& config, const std::vector<std::string>& positionals,
            const OutputFormatter& fmt) {
    if (positionals.empty()) {
        return Fail(fmt, Error::Make(ErrorCategory::InvalidArguments, "call", "",
                                     "Missing TOOL name (mcpfs call TOOL key=value ...)"));
    }
    const auto& tool_name = positionals.front();
    auto arguments = ParseKeyValueArgs(
        std::vector<std::string>(positionals.begin() + 1, positionals.end()));
    if (arguments.IsErr()) return Fail(fmt, arguments.Error());

    auto client = McpClient::Start(config.client);
    if (client.IsErr()) return Fail(fmt, client.Error());
    auto& connection = *client.Value();

    auto tools = ExportAll(connection, std::chrono::milliseconds(config.client.call_timeout_ms));
    if (tools.IsErr()) return Fail(fmt, tools.Error());

    const AgentTool* tool = nullptr;
    for (const auto& t : tools.Value()) {
        if (t.Name() == tool_name) tool = &t;
    }
    if (tool == nullptr) {
        return Fail(fmt, Error::Make(ErrorCategory::UnknownTool, "call", tool_name,
                                     "Unknown tool: " + tool_name));
    }

    auto text = tool->invoke(arguments.Value());
    connection.Shutdown();
    if (text.IsErr()) return Fail(fmt, text.Error());

    fmt.PrintText(text.Value());
    return 0;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    auto cl = SplitCommandLine(argc, argv);

    bool force_color = false;
    bool force_no_color = false;
    for (const auto& f : cl.flag_args) {
        if (f == "--color") force_color = true;
        if (f == "--no-color") force_no_color = true;
    }

    if (cl.version) {
        std::cout << "mcpfs " << kVersion << " (MCP " << kProtocolVersion << ")\n";
        return 0;
    }
    if (cl.help || cl.command.empty()) {
        auto& out = cl.help ? std::cout : std::cerr;
        PrintUsage(out, ResolveColor(cl.help ? STDOUT_FILENO : STDERR_FILENO,
                                     force_color, force_no_color));
        return cl.help ? 0 : kExitUsage;
    }

    OutputFormatter early_fmt(false, ResolveColor(STDERR_FILENO, force_color, force_no_color));

    // Step 1: CLI flags.
    std::vector<const char*> flag_argv;
    for (const auto& f : cl.flag_args) flag_argv.push_back(f.c_str());
    auto cli = LoadFromCli(static_cast<int>(flag_argv.size()), flag_argv.data());
    if (cli.IsErr()) return Fail(early_fmt, cli.Error());

    // Step 2: YAML underneath, CLI wins.
    AppConfig config = cli.Value();
    if (config.config_path.has_value()) {
        auto yaml = LoadFromYaml(*config.config_path);
        if (yaml.IsErr()) return Fail(early_fmt, yaml.Error());
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    // Step 3: environment and built-in defaults, then validation.
    auto resolved = ResolveEnvDefaults(std::move(config));
    if (resolved.IsErr()) return Fail(early_fmt, resolved.Error());
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) return Fail(early_fmt, valid.Error());

    auto logging = InitLogging(config);
    if (logging.IsErr()) return Fail(early_fmt, logging.Error());

    bool out_color = ResolveColor(STDOUT_FILENO,
                                  config.color.has_value() && *config.color,
                                  config.color.has_value() && !*config.color);
    OutputFormatter fmt(config.json_output, out_color);

    if (cl.command == "serve") {
        return RunServe(config, fmt);
    }

    if (config.client.command.empty()) {
        config.client.command = DefaultServerCommand(config, argv[0]);
    }
    LogDebug("main", "Server command: " + config.client.command.front());

    if (cl.command == "tools") {
        return RunTools(config, fmt);
    }
    if (cl.command == "call") {
        return RunCall(config, cl.positionals, fmt);
    }

    fmt.PrintError(Error::Make(ErrorCategory::InvalidArguments, "main", cl.command,
                               "Unknown command: " + cl.command));
    PrintUsage(std::cerr, false);
    return kExitUsage;
}

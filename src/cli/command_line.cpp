#include <mcpfs/cli/command_line.hpp>

#include <mcpfs/core/ansi.hpp>

namespace mcpfs {

namespace {

constexpr const char* kValueFlags[] = {
    "-c", "--config", "--root", "--workers", "--max-frame-bytes",
    "--max-file-bytes", "--server-command", "--timeout", "--log-file",
    "--log-level",
};

} // anonymous namespace

bool FlagTakesValue(std::string_view flag) {
    for (const auto* f : kValueFlags) {
        if (flag == f) return true;
    }
    return false;
}

CommandLine SplitCommandLine(int argc, const char* const* argv) {
    CommandLine cl;
    cl.flag_args.emplace_back(argc > 0 ? argv[0] : "mcpfs");

    bool rest_positional = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};

        if (rest_positional || arg.empty() || arg[0] != '-' || arg == "-") {
            if (cl.command.empty()) {
                cl.command = std::string(arg);
            } else {
                cl.positionals.emplace_back(arg);
            }
            continue;
        }
        if (arg == "--") {
            rest_positional = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            cl.help = true;
            continue;
        }
        if (arg == "--version") {
            cl.version = true;
            continue;
        }

        cl.flag_args.emplace_back(arg);
        // "--flag=value" carries its own value.
        if (arg.find('=') == std::string_view::npos && FlagTakesValue(arg) &&
            i + 1 < argc) {
            cl.flag_args.emplace_back(argv[++i]);
        }
    }
    return cl;
}

Result<nlohmann::json, Error> ParseKeyValueArgs(const std::vector<std::string>& pairs) {
    nlohmann::json args = nlohmann::json::object();
    for (const auto& pair : pairs) {
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<nlohmann::json, Error>::Err(Error::Make(
                ErrorCategory::InvalidArguments, "ParseKeyValueArgs", pair,
                "Expected key=value, got '" + pair + "'"));
        }
        auto key = pair.substr(0, eq);
        auto raw = pair.substr(eq + 1);

        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (parsed.is_discarded()) {
            args[key] = raw;
        } else {
            args[key] = std::move(parsed);
        }
    }
    return Result<nlohmann::json, Error>::Ok(std::move(args));
}

void PrintUsage(std::ostream& out, bool color) {
    const char* bold = color ? ansi::kBold : "";
    const char* dim = color ? ansi::kDim : "";
    const char* reset = color ? ansi::kReset : "";

    out << bold << "mcpfs" << reset
        << " - sandboxed filesystem tools over MCP (stdio)\n\n"
        << bold << "Usage:" << reset << "\n"
        << "  mcpfs serve [--root DIR] [--workers N] [--max-frame-bytes N] [--max-file-bytes N]\n"
        << "  mcpfs tools [--json] [--root DIR | --server-command \"CMD ARGS\"]\n"
        << "  mcpfs call TOOL [key=value ...] [--timeout MS] [--json]\n\n"
        << bold << "Options:" << reset << "\n"
        << "  -c, --config FILE     YAML config file\n"
        << "  --log-file FILE       Append JSON log lines to FILE\n"
        << "  --log-level LEVEL     debug, info, warn or error\n"
        << "  --json-logs           Log JSON lines to stderr\n"
        << "  -v, -vv               More logging (info, debug)\n"
        << "  -q, --quiet           Errors only\n"
        << "  --color, --no-color   Force or disable color\n"
        << "  --version             Print version\n"
        << "  -h, --help            Show this help\n\n"
        << dim << "Example: mcpfs call read_file path=notes.txt --root /data" << reset << "\n";
}

} // namespace mcpfs

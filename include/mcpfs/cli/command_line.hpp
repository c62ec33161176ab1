#pragma once

#include <mcpfs/core/result.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpfs {

// ---------------------------------------------------------------------------
// CommandLine: argv split into subcommand, its positionals, and option flags.
//
// `flag_args` starts with argv[0] and keeps every option (and its value) in
// order, ready for LoadFromCli. --help/-h and --version are pulled out.
// ---------------------------------------------------------------------------
struct CommandLine {
    std::string command;
    std::vector<std::string> positionals;
    std::vector<std::string> flag_args;
    bool help = false;
    bool version = false;
};

CommandLine SplitCommandLine(int argc, const char* const* argv);

// True for options that consume the next token ("--root DIR").
bool FlagTakesValue(std::string_view flag);

// ["path=a.txt", "details=true"] -> {"path":"a.txt","details":true}.
// Values that parse as a JSON scalar keep that type; anything else is a
// string. Objects and arrays are accepted as written.
Result<nlohmann::json, Error> ParseKeyValueArgs(const std::vector<std::string>& pairs);

void PrintUsage(std::ostream& out, bool color);

} // namespace mcpfs

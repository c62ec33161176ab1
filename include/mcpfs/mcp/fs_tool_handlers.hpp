#pragma once

#include <mcpfs/mcp/tool_registry.hpp>
#include <mcpfs/sandbox/path_sandbox.hpp>

#include <cstddef>
#include <string_view>

namespace mcpfs {

struct FsToolOptions {
    std::size_t max_file_bytes = 10 * 1024 * 1024;
};

// Register read_file, list_directory and write_file. Every handler validates
// its path through `sandbox` before touching the filesystem. The handlers keep
// a copy of the sandbox and are safe to run concurrently.
Result<void, Error> RegisterFilesystemTools(ToolRegistry& registry,
                                            const PathSandbox& sandbox,
                                            FsToolOptions options = {});

bool IsValidUtf8(std::string_view text);

} // namespace mcpfs

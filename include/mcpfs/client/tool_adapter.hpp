#pragma once

#include <mcpfs/client/mcp_client.hpp>
#include <mcpfs/core/result.hpp>
#include <mcpfs/mcp/tool_types.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpfs {

// ---------------------------------------------------------------------------
// AgentTool: one server tool bound for an agent framework.
//
// FunctionSchema() is the OpenAI-style function-calling entry
//   {"type":"function","function":{"name","description","parameters"}}.
// invoke() calls the tool through the client and returns the joined text.
// ---------------------------------------------------------------------------
struct AgentTool {
    ToolDescriptor descriptor;
    std::function<Result<std::string, Error>(const nlohmann::json& arguments)> invoke;

    [[nodiscard]] const std::string& Name() const noexcept { return descriptor.name; }
    [[nodiscard]] nlohmann::json FunctionSchema() const;
};

// Text chunks joined with '\n'; an isError result becomes a HandlerExecution
// error carrying that text.
Result<std::string, Error> UnwrapToolResult(const ToolResult& result,
                                            const std::string& tool);

// Lists the server's tools once and binds each to `client`. The bindings
// hold a reference to `client`, which must outlive them.
Result<std::vector<AgentTool>, Error> ExportAll(
    McpClient& client, std::chrono::milliseconds default_timeout);

} // namespace mcpfs

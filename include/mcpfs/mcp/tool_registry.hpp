#pragma once

#include <mcpfs/core/result.hpp>
#include <mcpfs/mcp/tool_types.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpfs {

// A tool handler receives arguments that already passed schema validation.
using ToolHandler =
    std::function<Result<ToolResult, Error>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools.
//
// Filled once at startup, then only read: Dispatch() is const and may run on
// several worker threads at once.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails on an invalid or duplicate tool name.
    Result<void, Error> Register(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] const ToolDescriptor* Find(const std::string& name) const;

    // Looks the tool up, validates `arguments`, runs the handler.
    // Unknown name -> UnknownTool, schema mismatch -> InvalidArguments
    // (handler not invoked), handler exception -> HandlerExecution.
    [[nodiscard]] Result<ToolResult, Error> Dispatch(
        const std::string& name, const nlohmann::json& arguments) const;

    // Schema check alone. Null arguments count as {}.
    static Result<void, Error> ValidateArguments(const ToolDescriptor& descriptor,
                                                 const nlohmann::json& arguments);

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcpfs

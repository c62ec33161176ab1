#include <mcpfs/client/tool_adapter.hpp>

#include <mcpfs/core/log.hpp>

namespace mcpfs {

nlohmann::json AgentTool::FunctionSchema() const {
    return {{"type", "function"},
            {"function", {{"name", descriptor.name},
                          {"description", descriptor.description},
                          {"parameters", descriptor.InputSchema()}}}};
}

Result<std::string, Error> UnwrapToolResult(const ToolResult& result,
                                            const std::string& tool) {
    auto text = result.JoinedText();
    if (result.is_error) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorCategory::HandlerExecution, "AgentTool::Invoke", tool,
            text.empty() ? "Tool reported an error" : text));
    }
    return Result<std::string, Error>::Ok(std::move(text));
}

Result<std::vector<AgentTool>, Error> ExportAll(
    McpClient& client, std::chrono::milliseconds default_timeout) {
    auto listed = client.ListTools(default_timeout);
    if (listed.IsErr()) {
        LogError("adapter", "Tool listing failed: " + listed.Error().ToString());
        return Result<std::vector<AgentTool>, Error>::Err(listed.Error());
    }

    std::vector<AgentTool> tools;
    for (auto& descriptor : std::move(listed).Value()) {
        auto name = descriptor.name;
        AgentTool tool;
        tool.descriptor = std::move(descriptor);
        tool.invoke = [&client, name, default_timeout](const nlohmann::json& arguments)
            -> Result<std::string, Error> {
            auto result = client.Call(name, arguments, default_timeout);
            if (result.IsErr()) {
                return Result<std::string, Error>::Err(result.Error());
            }
            return UnwrapToolResult(result.Value(), name);
        };
        LogInfo("adapter", "Bound tool " + name);
        tools.push_back(std::move(tool));
    }
    return Result<std::vector<AgentTool>, Error>::Ok(std::move(tools));
}

} // namespace mcpfs

#include <mcpfs/mcp/tool_registry.hpp>

#include <mcpfs/core/log.hpp>
#include <mcpfs/core/types.hpp>

namespace mcpfs {

namespace {

constexpr const char* kDispatchOp = "ToolRegistry::Dispatch";

Error ArgumentError(const std::string& tool, const std::string& message) {
    return Error::Make(ErrorCategory::InvalidArguments, kDispatchOp, tool, message);
}

} // anonymous namespace

Result<void, Error> ToolRegistry::Register(ToolDescriptor descriptor,
                                           ToolHandler handler) {
    auto name = ToolName::Create(descriptor.name);
    if (name.IsErr()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "ToolRegistry::Register", descriptor.name,
            name.Error()));
    }
    if (handlers_.count(descriptor.name) > 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "ToolRegistry::Register", descriptor.name,
            "Tool already registered: " + descriptor.name));
    }
    if (!handler) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "ToolRegistry::Register", descriptor.name,
            "Tool handler must not be empty"));
    }

    handlers_[descriptor.name] = std::move(handler);
    descriptors_.push_back(std::move(descriptor));
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    for (const auto& d : descriptors_) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

Result<void, Error> ToolRegistry::ValidateArguments(
    const ToolDescriptor& descriptor, const nlohmann::json& arguments) {
    if (arguments.is_null()) {
        return ValidateArguments(descriptor, nlohmann::json::object());
    }
    if (!arguments.is_object()) {
        return Result<void, Error>::Err(ArgumentError(
            descriptor.name, "Arguments must be a JSON object"));
    }

    for (const auto& p : descriptor.parameters) {
        auto it = arguments.find(p.name);
        if (it == arguments.end() || it->is_null()) {
            if (p.required) {
                return Result<void, Error>::Err(ArgumentError(
                    descriptor.name, "Missing required parameter: " + p.name));
            }
            continue;
        }
        if (!MatchesParamType(*it, p.type)) {
            return Result<void, Error>::Err(ArgumentError(
                descriptor.name,
                "Parameter '" + p.name + "' must be of type " +
                    ParamTypeName(p.type) + ", got " + it->type_name()));
        }
    }

    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (descriptor.FindParameter(it.key()) == nullptr) {
            return Result<void, Error>::Err(ArgumentError(
                descriptor.name, "Unknown parameter: " + it.key()));
        }
    }

    return Result<void, Error>::Ok();
}

Result<ToolResult, Error> ToolRegistry::Dispatch(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    const auto* descriptor = Find(name);
    if (it == handlers_.end() || descriptor == nullptr) {
        return Result<ToolResult, Error>::Err(Error::Make(
            ErrorCategory::UnknownTool, kDispatchOp, name, "Unknown tool: " + name));
    }

    auto valid = ValidateArguments(*descriptor, arguments);
    if (valid.IsErr()) {
        return Result<ToolResult, Error>::Err(valid.Error());
    }

    const auto& args = arguments.is_null() ? nlohmann::json::object() : arguments;
    try {
        return it->second(args);
    } catch (const std::exception& e) {
        LogError("registry", "Tool '" + name + "' threw: " + e.what());
        return Result<ToolResult, Error>::Err(Error::Make(
            ErrorCategory::HandlerExecution, kDispatchOp, name,
            std::string("Tool error: ") + e.what()));
    } catch (...) {
        LogError("registry", "Tool '" + name + "' threw a non-standard exception");
        return Result<ToolResult, Error>::Err(Error::Make(
            ErrorCategory::HandlerExecution, kDispatchOp, name,
            "Tool error: unknown exception"));
    }
}

} // namespace mcpfs

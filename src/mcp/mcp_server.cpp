#include <mcpfs/mcp/mcp_server.hpp>

#include <mcpfs/core/log.hpp>
#include <mcpfs/core/task_pool.hpp>
#include <mcpfs/core/version.hpp>
#include <mcpfs/mcp/message.hpp>
#include <mcpfs/mcp/response_writer.hpp>

#include <exception>
#include <optional>
#include <string>

namespace mcpfs {

namespace {

bool IsToolsCall(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("id")) return false;
    auto method = message.find("method");
    return method != message.end() && *method == "tools/call";
}

// Best-effort id for replying to a message that failed structural checks.
nlohmann::json IdOf(const nlohmann::json& message) {
    if (!message.is_object()) return nullptr;
    auto it = message.find("id");
    if (it == message.end()) return nullptr;
    if (it->is_number_integer() || it->is_string()) return *it;
    return nullptr;
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Idle:        return "idle";
        case ServerState::Reading:     return "reading";
        case ServerState::Dispatching: return "dispatching";
        case ServerState::Stopped:     return "stopped";
    }
    return "unknown";
}

McpServer::McpServer(ToolRegistry registry,
                     ServerOptions options,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), options_(std::move(options)),
      in_(in), out_(out) {}

void McpServer::Run() {
    IstreamByteSource source(in_);
    FrameReader reader(source, options_.max_frame_bytes);
    ResponseWriter writer(out_);
    TaskPool pool(options_.max_workers);

    LogInfo("server", "Serving " + std::to_string(registry_.Tools().size()) +
                          " tools with " + std::to_string(pool.Workers()) + " workers");

    while (!stop_requested_.load()) {
        state_ = ServerState::Reading;
        auto frame = reader.Next();
        if (frame.IsErr()) {
            const auto& error = frame.Error();
            if (error.category != ErrorCategory::MalformedFrame) {
                LogError("server", error.ToString());
                break;
            }
            LogWarn("server", error.message);
            Error parse_error = error;
            parse_error.message = "Parse error: " + error.message;
            writer.Post(MakeError(nullptr, parse_error));
            continue;
        }
        if (!frame.Value().has_value()) {
            LogInfo("server", "End of input");
            break;
        }

        state_ = ServerState::Dispatching;
        const auto& message = *frame.Value();
        if (IsToolsCall(message)) {
            auto submitted = pool.Submit([this, &writer, message] {
                auto response = HandleMessageOrInternalError(message);
                if (response) writer.Post(*response);
            });
            if (!submitted) {
                writer.Post(MakeError(IdOf(message), Error::Make(
                    ErrorCategory::Internal, "McpServer::Run", "",
                    "Server is shutting down")));
            }
        } else {
            auto response = HandleMessageOrInternalError(message);
            if (response) writer.Post(*response);
        }
    }

    pool.Shutdown();
    writer.Close();
    state_ = ServerState::Stopped;
    LogInfo("server", "Stopped after " + std::to_string(writer.FramesWritten()) +
                          " responses");
}

std::optional<nlohmann::json> McpServer::HandleMessageOrInternalError(
    const nlohmann::json& message) {
    std::string what;
    try {
        return HandleMessage(message);
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        what = "unknown exception";
    }
    LogError("server", "Request failed: " + what);
    return MakeError(IdOf(message), Error::Make(
        ErrorCategory::Internal, "McpServer::HandleMessage", "",
        "Internal error: " + what));
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    auto parsed = ParseMessage(message);
    if (parsed.IsErr()) {
        // Structurally invalid request: -32600, not a parse error.
        return MakeError(IdOf(message), Error::Make(
            ErrorCategory::Protocol, "McpServer::HandleMessage", "",
            "Invalid Request: " + parsed.Error().message));
    }

    const auto& msg = parsed.Value();
    if (const auto* note = std::get_if<Notification>(&msg)) {
        LogDebug("server", "Notification: " + note->method);
        return std::nullopt;
    }
    if (std::get_if<Response>(&msg) != nullptr) {
        LogDebug("server", "Ignoring unsolicited response");
        return std::nullopt;
    }

    const auto& request = std::get<Request>(msg);
    const auto& id = request.id;
    const auto& method = request.method;
    auto params = request.params.is_null() ? nlohmann::json::object() : request.params;

    LogDebug("server", "Request " + id.dump() + ": " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "shutdown") {
        stop_requested_ = true;
        LogInfo("server", "Shutdown requested");
        return MakeResult(id, nlohmann::json::object());
    } else {
        auto error = Error::Make(ErrorCategory::Protocol, "McpServer::HandleMessage",
                                 method, "Method not found: " + method);
        error.rpc_code = -32601;
        return MakeError(id, error);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        const auto& client_info = params["clientInfo"];
        auto name = client_info.find("name");
        LogInfo("server", "Client: " + (name != client_info.end() && name->is_string()
                                            ? name->get<std::string>()
                                            : std::string("?")));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", options_.server_name},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, Error::Make(ErrorCategory::InvalidArguments,
                                         "McpServer::HandleToolsCall", "",
                                         "Missing 'name' parameter"));
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json());

    auto result = registry_.Dispatch(tool_name, arguments);
    if (result.IsErr()) {
        LogWarn("server", result.Error().ToString());
        return MakeError(id, result.Error());
    }

    const auto& tool_result = result.Value();
    nlohmann::json response_result;
    response_result["content"] = tool_result.content;
    if (tool_result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, const Error& error) {
    return ToJson(Response::Failure(id, RpcError::FromError(error)));
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return ToJson(Response::Success(id, result));
}

} // namespace mcpfs

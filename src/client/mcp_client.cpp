#include <mcpfs/client/mcp_client.hpp>

#include <mcpfs/core/log.hpp>
#include <mcpfs/core/version.hpp>
#include <mcpfs/mcp/codec.hpp>
#include <mcpfs/mcp/message.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <unistd.h>

namespace mcpfs {

namespace {

constexpr auto kKillWait = std::chrono::milliseconds(5000);

} // anonymous namespace

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Ready:  return "ready";
        case ConnectionState::Lost:   return "lost";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<std::unique_ptr<McpClient>, Error> McpClient::Start(const ClientConfig& config) {
    using R = Result<std::unique_ptr<McpClient>, Error>;

    auto child = ChildProcess::Spawn(config.command);
    if (child.IsErr()) {
        return R::Err(child.Error());
    }

    std::unique_ptr<McpClient> client(new McpClient(config, std::move(child).Value()));
    auto* raw = client.get();
    client->reader_ = std::thread([raw] { raw->ReaderLoop(); });
    client->stderr_reader_ = std::thread([raw] { raw->StderrLoop(); });

    auto handshake = client->Handshake();
    if (handshake.IsErr()) {
        client->Shutdown();
        return R::Err(handshake.Error());
    }

    std::string server_name = "server";
    if (client->server_info_.contains("name") && client->server_info_["name"].is_string()) {
        server_name = client->server_info_["name"].get<std::string>();
    }
    LogInfo("client", "Connected to " + server_name + " (pid " +
                          std::to_string(client->ServerPid()) + ")");
    return R::Ok(std::move(client));
}

McpClient::McpClient(ClientConfig config, ChildProcess child)
    : config_(std::move(config)), child_(std::move(child)) {}

McpClient::~McpClient() {
    Shutdown();
}

void McpClient::Shutdown() {
    if (shut_down_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Closed;
    }
    FailAllPending("Connection closed");

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        child_.CloseStdin();
    }

    const auto grace = std::chrono::milliseconds(config_.shutdown_grace_ms);
    if (!child_.WaitFor(grace)) {
        LogDebug("client", "Server did not exit on EOF; sending SIGTERM");
        child_.Signal(SIGTERM);
        if (!child_.WaitFor(grace)) {
            LogWarn("client", "Server ignored SIGTERM; sending SIGKILL");
            child_.Signal(SIGKILL);
            if (!child_.WaitFor(kKillWait)) {
                LogError("client", "Server pid " + std::to_string(child_.Pid()) +
                                       " did not exit after SIGKILL");
            }
        }
    }

    if (reader_.joinable()) reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
    LogDebug("client", "Connection closed");
}

Result<void, Error> McpClient::Handshake() {
    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", config_.client_name}, {"version", kVersion}}}
    };

    auto result = SendRequest("initialize", params,
                              std::chrono::milliseconds(config_.startup_timeout_ms),
                              "McpClient::Start", "initialize");
    if (result.IsErr()) {
        return Result<void, Error>::Err(result.Error());
    }

    const auto& init = result.Value();
    if (!init.is_object() || !init.contains("protocolVersion")) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Protocol, "McpClient::Start", "initialize",
            "Invalid initialize result: " + init.dump()));
    }
    if (init["protocolVersion"] != kProtocolVersion) {
        LogWarn("client", "Server speaks protocol " + init["protocolVersion"].dump() +
                              ", expected " + kProtocolVersion);
    }
    if (init.contains("serverInfo") && init["serverInfo"].is_object()) {
        server_info_ = init["serverInfo"];
    } else {
        server_info_ = nlohmann::json::object();
    }

    return WriteFrame(ToJson(Notification{"notifications/initialized", nullptr}));
}

// ---------------------------------------------------------------------------
// Calls
// ---------------------------------------------------------------------------
Result<ToolResult, Error> McpClient::Call(
    const std::string& tool, const nlohmann::json& arguments,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<ToolResult, Error>;

    nlohmann::json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    auto outcome = SendRequest("tools/call", params, timeout.value_or(DefaultTimeout()),
                               "McpClient::Call", tool);
    if (outcome.IsErr()) {
        return R::Err(outcome.Error());
    }

    const auto& result = outcome.Value();
    if (!result.is_object() || !result.contains("content") ||
        !result["content"].is_array()) {
        return R::Err(Error::Make(ErrorCategory::Protocol, "McpClient::Call", tool,
                                  "Malformed tools/call result: " + result.dump()));
    }

    ToolResult tool_result;
    tool_result.content = result["content"];
    auto is_error = result.find("isError");
    tool_result.is_error = is_error != result.end() && is_error->is_boolean() &&
                           is_error->get<bool>();
    return R::Ok(std::move(tool_result));
}

Result<std::vector<ToolDescriptor>, Error> McpClient::ListTools(
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<std::vector<ToolDescriptor>, Error>;

    auto outcome = SendRequest("tools/list", nlohmann::json::object(),
                               timeout.value_or(DefaultTimeout()),
                               "McpClient::ListTools", "");
    if (outcome.IsErr()) {
        return R::Err(outcome.Error());
    }

    const auto& result = outcome.Value();
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return R::Err(Error::Make(ErrorCategory::Protocol, "McpClient::ListTools", "",
                                  "Malformed tools/list result"));
    }

    std::vector<ToolDescriptor> tools;
    for (const auto& entry : result["tools"]) {
        auto descriptor = ToolDescriptor::FromJson(entry);
        if (descriptor.IsErr()) {
            return R::Err(Error::Make(ErrorCategory::Protocol, "McpClient::ListTools", "",
                                      descriptor.Error()));
        }
        tools.push_back(std::move(descriptor).Value());
    }
    return R::Ok(std::move(tools));
}

Result<void, Error> McpClient::Ping(std::optional<std::chrono::milliseconds> timeout) {
    auto outcome = SendRequest("ping", nullptr, timeout.value_or(DefaultTimeout()),
                               "McpClient::Ping", "");
    if (outcome.IsErr()) {
        return Result<void, Error>::Err(outcome.Error());
    }
    return Result<void, Error>::Ok();
}

McpClient::Outcome McpClient::SendRequest(const std::string& method,
                                          const nlohmann::json& params,
                                          std::chrono::milliseconds timeout,
                                          const std::string& operation,
                                          const std::string& target) {
    std::int64_t id = 0;
    std::future<Outcome> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Ready) {
            return Outcome::Err(Error::Make(
                ErrorCategory::ConnectionLost, operation, target,
                state_ == ConnectionState::Closed ? "Connection closed"
                                                  : "Connection lost"));
        }
        id = next_id_++;
        PendingCall call;
        call.operation = operation;
        call.target = target;
        future = call.promise.get_future();
        pending_.emplace(id, std::move(call));
    }

    LogDebug("client", "-> " + method + " #" + std::to_string(id));
    auto written = WriteFrame(ToJson(Request{id, method, params}));
    if (written.IsErr()) {
        // Fails every pending call, this one included.
        MarkLost(written.Error().message);
        return future.get();
    }

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            pending_.erase(it);
            return Outcome::Err(Error::Make(
                ErrorCategory::Timeout, operation, target,
                method + " timed out after " + std::to_string(timeout.count()) + " ms"));
        }
    }
    // Resolved between the wait and the lock.
    return future.get();
}

Result<void, Error> McpClient::WriteFrame(const nlohmann::json& message) {
    auto frame = EncodeFrame(message);

    std::lock_guard<std::mutex> lock(write_mutex_);
    int fd = child_.StdinFd();
    if (fd < 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ConnectionLost, "McpClient::WriteFrame", "",
            "Server stdin is closed"));
    }

    std::size_t offset = 0;
    while (offset < frame.size()) {
        auto n = ::write(fd, frame.data() + offset, frame.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::ConnectionLost, "McpClient::WriteFrame", "",
                std::string("Write to server failed: ") + std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Background readers
// ---------------------------------------------------------------------------
void McpClient::ReaderLoop() {
    FdByteSource source(child_.StdoutFd());
    FrameReader reader(source, config_.max_frame_bytes);

    for (;;) {
        auto frame = reader.Next();
        if (frame.IsErr()) {
            const auto& error = frame.Error();
            if (error.category == ErrorCategory::MalformedFrame) {
                LogError("client", "Malformed frame from server: " + error.message);
                MarkLost("Malformed frame from server: " + error.message);
                child_.Signal(SIGTERM);
            } else {
                MarkLost(error.message);
            }
            return;
        }
        if (!frame.Value().has_value()) {
            MarkLost("Server closed its output");
            return;
        }
        if (!HandleIncoming(*frame.Value())) {
            return;
        }
    }
}

void McpClient::StderrLoop() {
    const int fd = child_.StderrFd();
    std::string buffer;
    char chunk[4096];

    for (;;) {
        auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            auto line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty()) LogInfo("server", line);
        }
    }
    if (!buffer.empty()) LogInfo("server", buffer);
}

bool McpClient::HandleIncoming(const nlohmann::json& message) {
    auto parsed = ParseMessage(message);
    if (parsed.IsErr()) {
        LogError("client", "Invalid message from server: " + parsed.Error().message);
        MarkLost("Invalid message from server: " + parsed.Error().message);
        child_.Signal(SIGTERM);
        return false;
    }

    const auto& msg = parsed.Value();
    if (const auto* response = std::get_if<Response>(&msg)) {
        if (!response->id.is_number_integer()) {
            LogDebug("client", "Discarding response with foreign id " + response->id.dump());
            return true;
        }
        auto id = response->id.get<std::int64_t>();
        PendingCall call;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end()) {
                call = std::move(it->second);
                pending_.erase(it);
                found = true;
            }
        }
        if (!found) {
            LogDebug("client", "Discarding late response #" + std::to_string(id));
            return true;
        }
        if (response->error.has_value()) {
            call.promise.set_value(
                Outcome::Err(response->error->ToError(call.operation, call.target)));
        } else {
            call.promise.set_value(Outcome::Ok(response->result.value_or(nullptr)));
        }
        return true;
    }

    if (const auto* request = std::get_if<Request>(&msg)) {
        nlohmann::json reply;
        if (request->method == "ping") {
            reply = ToJson(Response::Success(request->id, nlohmann::json::object()));
        } else {
            auto error = Error::Make(ErrorCategory::Protocol, "McpClient::HandleIncoming",
                                     request->method,
                                     "Method not found: " + request->method);
            error.rpc_code = -32601;
            reply = ToJson(Response::Failure(request->id, RpcError::FromError(error)));
        }
        auto written = WriteFrame(reply);
        if (written.IsErr()) {
            MarkLost(written.Error().message);
            return false;
        }
        return true;
    }

    const auto& note = std::get<Notification>(msg);
    LogDebug("client", "Server notification: " + note.method);
    return true;
}

void McpClient::MarkLost(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Ready) {
            state_ = ConnectionState::Lost;
            LogWarn("client", "Connection lost: " + reason);
        }
    }
    FailAllPending(reason);
}

void McpClient::FailAllPending(const std::string& reason) {
    std::map<std::int64_t, PendingCall> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }
    for (auto& entry : failed) {
        auto& call = entry.second;
        call.promise.set_value(Outcome::Err(Error::Make(
            ErrorCategory::ConnectionLost, call.operation, call.target, reason)));
    }
}

ConnectionState McpClient::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t McpClient::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace mcpfs

#pragma once

#include <mcpfs/client/child_process.hpp>
#include <mcpfs/config/app_config.hpp>
#include <mcpfs/core/result.hpp>
#include <mcpfs/mcp/tool_types.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpfs {

enum class ConnectionState {
    Ready,
    Lost,    // server exited, closed its output or sent a malformed frame
    Closed,  // Shutdown() was called
};

const char* ConnectionStateName(ConnectionState state);

// ---------------------------------------------------------------------------
// McpClient: owns one MCP server subprocess and multiplexes calls over its
// stdin/stdout.
//
// Any number of threads may Call() concurrently; each waits on its own
// request id while a background reader resolves responses in whatever order
// they arrive. The server's stderr is drained into the logger (component
// "server"). Lost and Closed are terminal: no reconnect.
// ---------------------------------------------------------------------------
class McpClient {
public:
    // Spawn config.command and complete the initialize handshake within
    // config.startup_timeout_ms.
    static Result<std::unique_ptr<McpClient>, Error> Start(const ClientConfig& config);

    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // tools/call. Timeout defaults to config.call_timeout_ms. A timed-out
    // call is forgotten; the server may still run it to completion.
    [[nodiscard]] Result<ToolResult, Error> Call(
        const std::string& tool, const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] Result<void, Error> Ping(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Close stdin, wait shutdown_grace_ms, then SIGTERM, then SIGKILL.
    // Pending calls fail with ConnectionLost. Idempotent.
    void Shutdown();

    [[nodiscard]] ConnectionState State() const;
    [[nodiscard]] std::size_t PendingCount() const;
    [[nodiscard]] pid_t ServerPid() const noexcept { return child_.Pid(); }

    // serverInfo from the initialize result.
    [[nodiscard]] const nlohmann::json& ServerInfo() const noexcept { return server_info_; }

private:
    using Outcome = Result<nlohmann::json, Error>;

    struct PendingCall {
        std::promise<Outcome> promise;
        std::string operation;
        std::string target;
    };

    McpClient(ClientConfig config, ChildProcess child);

    Outcome SendRequest(const std::string& method, const nlohmann::json& params,
                        std::chrono::milliseconds timeout,
                        const std::string& operation, const std::string& target);
    Result<void, Error> WriteFrame(const nlohmann::json& message);
    Result<void, Error> Handshake();

    void ReaderLoop();
    void StderrLoop();
    // False if the message is unusable and the connection must go down.
    bool HandleIncoming(const nlohmann::json& message);
    void Resolve(std::int64_t id, Outcome outcome);
    void MarkLost(const std::string& reason);
    void FailAllPending(const std::string& reason);

    std::chrono::milliseconds DefaultTimeout() const {
        return std::chrono::milliseconds(config_.call_timeout_ms);
    }

    ClientConfig config_;
    ChildProcess child_;
    nlohmann::json server_info_;

    mutable std::mutex mutex_;  // guards state_ and pending_
    ConnectionState state_ = ConnectionState::Ready;
    std::map<std::int64_t, PendingCall> pending_;
    std::atomic<std::int64_t> next_id_{1};

    std::mutex write_mutex_;
    std::atomic<bool> shut_down_{false};
    std::thread reader_;
    std::thread stderr_reader_;
};

} // namespace mcpfs

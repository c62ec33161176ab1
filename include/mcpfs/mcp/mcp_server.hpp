#pragma once

#include <mcpfs/mcp/codec.hpp>
#include <mcpfs/mcp/tool_registry.hpp>

#include <atomic>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcpfs {

struct ServerOptions {
    std::size_t max_workers = 4;
    std::size_t max_frame_bytes = kDefaultMaxFrameBytes;
    std::string server_name = "mcpfs";
};

enum class ServerState {
    Idle,
    Reading,
    Dispatching,
    Stopped,
};

const char* ServerStateName(ServerState state);

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call   (runs on the worker pool; replies may be out of order)
//   - ping
//   - shutdown     (stops reading, waits for in-flight calls)
//   - notifications/initialized (notification, no response)
//
// Diagnostics go through the global logger, never to `out`.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       ServerOptions options = {},
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF, a read error, or `shutdown`).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. Safe to call concurrently.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] ServerState State() const noexcept { return state_.load(); }
    [[nodiscard]] bool Initialized() const noexcept { return initialized_.load(); }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    // HandleMessage, with any exception turned into a -32603 reply.
    std::optional<nlohmann::json> HandleMessageOrInternalError(
        const nlohmann::json& message);
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id, const Error& error);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    ServerOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<ServerState> state_{ServerState::Idle};
};

} // namespace mcpfs

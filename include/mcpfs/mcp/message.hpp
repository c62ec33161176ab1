#pragma once

#include <mcpfs/core/result.hpp>

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcpfs {

// JSON-RPC 2.0 error object.
struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent

    static RpcError FromError(const Error& error);

    // Inverse of FromError(); uses data.category when present.
    [[nodiscard]] Error ToError(const std::string& operation,
                                const std::string& target) const;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message && data == other.data;
    }
};

// A call expecting a response. `id` is a JSON number or string.
struct Request {
    nlohmann::json id;
    std::string method;
    nlohmann::json params;  // null when absent

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
};

// Exactly one of `result` / `error` is set.
struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, RpcError error);

    bool operator==(const Response& other) const {
        return id == other.id && result == other.result && error == other.error;
    }
};

// A message without id; never answered.
struct Notification {
    std::string method;
    nlohmann::json params;

    bool operator==(const Notification& other) const {
        return method == other.method && params == other.params;
    }
};

using Message = std::variant<Request, Response, Notification>;

[[nodiscard]] nlohmann::json ToJson(const Message& message);

// Structural JSON-RPC 2.0 check and classification. Violations are
// MalformedFrame errors.
[[nodiscard]] Result<Message, Error> ParseMessage(const nlohmann::json& json);

} // namespace mcpfs

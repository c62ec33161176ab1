#include <mcpfs/core/result.hpp>

#include <cstdio>
#include <sstream>

namespace mcpfs {

namespace {

struct CategoryEntry {
    ErrorCategory category;
    const char* name;
};

constexpr CategoryEntry kCategories[] = {
    {ErrorCategory::PathEscape,       "path_escape"},
    {ErrorCategory::InvalidArguments, "invalid_arguments"},
    {ErrorCategory::UnknownTool,      "unknown_tool"},
    {ErrorCategory::NotFound,         "not_found"},
    {ErrorCategory::Io,               "io"},
    {ErrorCategory::HandlerExecution, "handler_execution"},
    {ErrorCategory::MalformedFrame,   "malformed_frame"},
    {ErrorCategory::Protocol,         "protocol"},
    {ErrorCategory::Timeout,          "timeout"},
    {ErrorCategory::ConnectionLost,   "connection_lost"},
    {ErrorCategory::Config,           "config"},
    {ErrorCategory::Internal,         "internal"},
};

// Fallback when the peer did not send data.category.
ErrorCategory CategoryFromRpcCode(int code) {
    switch (code) {
        case -32700: return ErrorCategory::MalformedFrame;
        case -32600: return ErrorCategory::Protocol;
        case -32601: return ErrorCategory::Protocol;
        case -32602: return ErrorCategory::InvalidArguments;
        case -32001: return ErrorCategory::PathEscape;
        case -32002: return ErrorCategory::NotFound;
        case -32003: return ErrorCategory::Io;
        case -32603: return ErrorCategory::HandlerExecution;
        default:     return ErrorCategory::Internal;
    }
}

// Core must not depend on nlohmann; escape by hand.
void AppendJsonString(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

} // anonymous namespace

const char* CategoryName(ErrorCategory category) {
    for (const auto& entry : kCategories) {
        if (entry.category == category) return entry.name;
    }
    return "internal";
}

std::optional<ErrorCategory> CategoryFromName(const std::string& name) {
    for (const auto& entry : kCategories) {
        if (name == entry.name) return entry.category;
    }
    return std::nullopt;
}

Error Error::FromRpc(const std::string& operation,
                     const std::string& target,
                     int code,
                     const std::string& message,
                     const std::optional<std::string>& category_name) {
    ErrorCategory category = CategoryFromRpcCode(code);
    if (category_name.has_value()) {
        if (auto named = CategoryFromName(*category_name)) {
            category = *named;
        }
    }

    Error e = Make(category, operation, target, message);
    e.rpc_code = code;
    if (category == ErrorCategory::PathEscape) {
        e.hint = "Use a path inside the server's sandbox root";
    }
    return e;
}

int Error::RpcCode() const {
    if (rpc_code.has_value()) return *rpc_code;
    switch (category) {
        case ErrorCategory::PathEscape:       return -32001;
        case ErrorCategory::NotFound:         return -32002;
        case ErrorCategory::Io:               return -32003;
        case ErrorCategory::InvalidArguments: return -32602;
        case ErrorCategory::UnknownTool:      return -32602;
        case ErrorCategory::MalformedFrame:   return -32700;
        case ErrorCategory::Protocol:         return -32600;
        case ErrorCategory::HandlerExecution: return -32603;
        case ErrorCategory::Timeout:
        case ErrorCategory::ConnectionLost:
        case ErrorCategory::Config:
        case ErrorCategory::Internal:         return -32603;
    }
    return -32603;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << ": " << message;
    if (rpc_code.has_value()) {
        oss << " (rpc " << *rpc_code << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":)";
    AppendJsonString(oss, CategoryName());
    oss << R"(,"operation":)";
    AppendJsonString(oss, operation);
    if (!target.empty()) {
        oss << R"(,"target":)";
        AppendJsonString(oss, target);
    }
    if (rpc_code.has_value()) {
        oss << R"(,"rpc_code":)" << *rpc_code;
    }
    oss << R"(,"message":)";
    AppendJsonString(oss, message);
    if (hint.has_value() && !hint->empty()) {
        oss << R"(,"hint":)";
        AppendJsonString(oss, *hint);
    }
    oss << R"(,"exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace mcpfs

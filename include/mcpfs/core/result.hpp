#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcpfs {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // -- ValueOr ------------------------------------------------------------

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for wire codes, exit codes and
// structured output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    PathEscape,
    InvalidArguments,
    UnknownTool,
    NotFound,
    Io,
    HandlerExecution,
    MalformedFrame,
    Protocol,
    Timeout,
    ConnectionLost,
    Config,
    Internal,
};

/// Stable lower_snake name of a category ("path_escape", "timeout", ...).
/// This is the value carried in `error.data.category` on the wire.
const char* CategoryName(ErrorCategory category);

/// Inverse of CategoryName(). Unknown names yield nullopt.
std::optional<ErrorCategory> CategoryFromName(const std::string& name);

// ---------------------------------------------------------------------------
// Error: structured error type for sandbox, registry, codec and connection
// operations.
//
// `operation` names the step that failed ("PathSandbox::Validate",
// "McpClient::Call"), `target` the path or tool it was working on.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> rpc_code;
    std::optional<std::string> hint;

    static Error Make(ErrorCategory category, std::string operation,
                      std::string target, std::string message) {
        Error e;
        e.operation = std::move(operation);
        e.target = std::move(target);
        e.message = std::move(message);
        e.category = category;
        return e;
    }

    /// Map a JSON-RPC error (code + optional category name from error.data)
    /// received from a peer back into an Error.
    static Error FromRpc(const std::string& operation,
                         const std::string& target,
                         int code,
                         const std::string& message,
                         const std::optional<std::string>& category_name);

    /// JSON-RPC error code used when this error is sent to a peer.
    [[nodiscard]] int RpcCode() const;

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::InvalidArguments: return 2;
            case ErrorCategory::UnknownTool:      return 2;
            case ErrorCategory::PathEscape:       return 3;
            case ErrorCategory::NotFound:         return 4;
            case ErrorCategory::Io:               return 5;
            case ErrorCategory::HandlerExecution: return 5;
            case ErrorCategory::MalformedFrame:   return 6;
            case ErrorCategory::Protocol:         return 6;
            case ErrorCategory::Timeout:          return 7;
            case ErrorCategory::ConnectionLost:   return 8;
            case ErrorCategory::Config:           return 9;
            case ErrorCategory::Internal:         return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        return mcpfs::CategoryName(category);
    }

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               category == other.category &&
               rpc_code == other.rpc_code &&
               hint == other.hint;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcpfs

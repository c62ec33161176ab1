#pragma once

#include <mcpfs/core/result.hpp>

#include <string>
#include <string_view>

namespace mcpfs {

// ---------------------------------------------------------------------------
// ToolName: validated tool identifier.
//
// Rules:
//   - Non-empty, max 64 characters
//   - First character is an ASCII letter or underscore
//   - Remaining characters are ASCII letters, digits, '_' or '-'
// ---------------------------------------------------------------------------
class ToolName {
public:
    static constexpr std::size_t kMaxLength = 64;

    static Result<ToolName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ToolName& other) const { return value_ == other.value_; }
    bool operator!=(const ToolName& other) const { return value_ != other.value_; }
    bool operator<(const ToolName& other) const { return value_ < other.value_; }

    ToolName(const ToolName&) = default;
    ToolName& operator=(const ToolName&) = default;
    ToolName(ToolName&&) noexcept = default;
    ToolName& operator=(ToolName&&) noexcept = default;

private:
    explicit ToolName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace mcpfs

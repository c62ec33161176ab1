#include <mcpfs/core/types.hpp>

#include <algorithm>

namespace mcpfs {

namespace {

bool IsAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsToolNameChar(char c) {
    return IsAsciiLetter(c) || IsAsciiDigit(c) || c == '_' || c == '-';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolName
// ---------------------------------------------------------------------------
Result<ToolName, std::string> ToolName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ToolName, std::string>::Err("Tool name must not be empty");
    }
    if (name.size() > kMaxLength) {
        return Result<ToolName, std::string>::Err(
            "Tool name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!IsAsciiLetter(name[0]) && name[0] != '_') {
        return Result<ToolName, std::string>::Err(
            "Tool name must start with a letter or underscore");
    }
    if (!std::all_of(name.begin(), name.end(), IsToolNameChar)) {
        return Result<ToolName, std::string>::Err(
            "Tool name must contain only letters, digits, '_' and '-'");
    }
    return Result<ToolName, std::string>::Ok(ToolName(std::string(name)));
}

} // namespace mcpfs

#pragma once

#include <mcpfs/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpfs {

// JSON Schema primitive types accepted for tool parameters.
enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object,
};

const char* ParamTypeName(ParamType type);
std::optional<ParamType> ParamTypeFromName(const std::string& name);

// True if `value` is an instance of `type` (integers count as numbers).
bool MatchesParamType(const nlohmann::json& value, ParamType type);

// ---------------------------------------------------------------------------
// ToolParameter: one named argument of a tool.
// ---------------------------------------------------------------------------
struct ToolParameter {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool required = true;

    bool operator==(const ToolParameter& other) const {
        return name == other.name && type == other.type &&
               description == other.description && required == other.required;
    }
};

// ---------------------------------------------------------------------------
// ToolDescriptor: advertised name, description and parameter list.
//
// InputSchema() renders the parameters as a JSON Schema object; FromJson()
// parses a `tools/list` entry back. JSON objects are key-sorted, so the
// parsed parameter list comes back ordered by name.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    [[nodiscard]] nlohmann::json InputSchema() const;

    // {"name", "description", "inputSchema"} as listed by tools/list.
    [[nodiscard]] nlohmann::json ToJson() const;

    static Result<ToolDescriptor, std::string> FromJson(const nlohmann::json& tool);

    [[nodiscard]] const ToolParameter* FindParameter(const std::string& param) const;

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               parameters == other.parameters;
    }
};

// ---------------------------------------------------------------------------
// ToolResult: ordered content chunks returned by a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();  // [{"type":"text","text":...}]
    bool is_error = false;

    static ToolResult Text(const std::string& text);
    static ToolResult TextChunks(const std::vector<std::string>& chunks);

    void AddText(const std::string& text);

    // Text of every "text" chunk, in order.
    [[nodiscard]] std::vector<std::string> Texts() const;

    // Texts() joined with '\n'.
    [[nodiscard]] std::string JoinedText() const;
};

} // namespace mcpfs

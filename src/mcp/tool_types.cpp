#include <mcpfs/mcp/tool_types.hpp>

namespace mcpfs {

const char* ParamTypeName(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Array:   return "array";
        case ParamType::Object:  return "object";
    }
    return "string";
}

std::optional<ParamType> ParamTypeFromName(const std::string& name) {
    if (name == "string") return ParamType::String;
    if (name == "integer") return ParamType::Integer;
    if (name == "number") return ParamType::Number;
    if (name == "boolean") return ParamType::Boolean;
    if (name == "array") return ParamType::Array;
    if (name == "object") return ParamType::Object;
    return std::nullopt;
}

bool MatchesParamType(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String:  return value.is_string();
        case ParamType::Integer: return value.is_number_integer();
        case ParamType::Number:  return value.is_number();
        case ParamType::Boolean: return value.is_boolean();
        case ParamType::Array:   return value.is_array();
        case ParamType::Object:  return value.is_object();
    }
    return false;
}

// ---------------------------------------------------------------------------
// ToolDescriptor
// ---------------------------------------------------------------------------
nlohmann::json ToolDescriptor::InputSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : parameters) {
        properties[p.name] = {{"type", ParamTypeName(p.type)},
                              {"description", p.description}};
        if (p.required) {
            required.push_back(p.name);
        }
    }
    return {{"type", "object"},
            {"properties", properties},
            {"required", required},
            {"additionalProperties", false}};
}

nlohmann::json ToolDescriptor::ToJson() const {
    return {{"name", name},
            {"description", description},
            {"inputSchema", InputSchema()}};
}

Result<ToolDescriptor, std::string> ToolDescriptor::FromJson(
    const nlohmann::json& tool) {
    using R = Result<ToolDescriptor, std::string>;
    if (!tool.is_object()) {
        return R::Err("Tool entry is not an object");
    }
    if (!tool.contains("name") || !tool["name"].is_string()) {
        return R::Err("Tool entry missing 'name'");
    }

    ToolDescriptor d;
    d.name = tool["name"].get<std::string>();
    if (tool.contains("description") && tool["description"].is_string()) {
        d.description = tool["description"].get<std::string>();
    }

    auto schema = tool.value("inputSchema", nlohmann::json::object());
    if (!schema.is_object()) {
        return R::Err("Tool '" + d.name + "' has a non-object inputSchema");
    }
    auto properties = schema.value("properties", nlohmann::json::object());
    auto required = schema.value("required", nlohmann::json::array());

    for (auto it = properties.begin(); it != properties.end(); ++it) {
        ToolParameter p;
        p.name = it.key();
        const auto& prop = it.value();
        if (prop.is_object()) {
            auto type_name = prop.value("type", "string");
            auto type = ParamTypeFromName(type_name);
            if (!type) {
                return R::Err("Tool '" + d.name + "' parameter '" + p.name +
                              "' has unsupported type '" + type_name + "'");
            }
            p.type = *type;
            p.description = prop.value("description", "");
        }
        p.required = false;
        if (required.is_array()) {
            for (const auto& r : required) {
                if (r.is_string() && r.get<std::string>() == p.name) {
                    p.required = true;
                    break;
                }
            }
        }
        d.parameters.push_back(std::move(p));
    }

    return R::Ok(std::move(d));
}

const ToolParameter* ToolDescriptor::FindParameter(const std::string& param) const {
    for (const auto& p : parameters) {
        if (p.name == param) return &p;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------
ToolResult ToolResult::Text(const std::string& text) {
    ToolResult r;
    r.AddText(text);
    return r;
}

ToolResult ToolResult::TextChunks(const std::vector<std::string>& chunks) {
    ToolResult r;
    for (const auto& c : chunks) {
        r.AddText(c);
    }
    return r;
}

void ToolResult::AddText(const std::string& text) {
    content.push_back({{"type", "text"}, {"text", text}});
}

std::vector<std::string> ToolResult::Texts() const {
    std::vector<std::string> texts;
    if (!content.is_array()) return texts;
    for (const auto& chunk : content) {
        if (chunk.is_object() && chunk.value("type", "") == "text" &&
            chunk.contains("text") && chunk["text"].is_string()) {
            texts.push_back(chunk["text"].get<std::string>());
        }
    }
    return texts;
}

std::string ToolResult::JoinedText() const {
    std::string joined;
    bool first = true;
    for (const auto& t : Texts()) {
        if (!first) joined += '\n';
        joined += t;
        first = false;
    }
    return joined;
}

} // namespace mcpfs

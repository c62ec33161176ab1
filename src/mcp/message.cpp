#include <mcpfs/mcp/message.hpp>

namespace mcpfs {

namespace {

constexpr const char* kParseOp = "ParseMessage";

Error Malformed(const std::string& message) {
    return Error::Make(ErrorCategory::MalformedFrame, kParseOp, "", message);
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_number_integer() || id.is_string() || id.is_null();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RpcError
// ---------------------------------------------------------------------------
RpcError RpcError::FromError(const Error& error) {
    RpcError rpc;
    rpc.code = error.RpcCode();
    rpc.message = error.message;
    rpc.data = {{"category", error.CategoryName()},
                {"operation", error.operation}};
    if (!error.target.empty()) {
        rpc.data["target"] = error.target;
    }
    if (error.hint.has_value()) {
        rpc.data["hint"] = *error.hint;
    }
    return rpc;
}

Error RpcError::ToError(const std::string& operation,
                        const std::string& target) const {
    std::optional<std::string> category;
    if (data.is_object() && data.contains("category") && data["category"].is_string()) {
        category = data["category"].get<std::string>();
    }
    auto e = Error::FromRpc(operation, target, code, message, category);
    if (data.is_object() && data.contains("hint") && data["hint"].is_string()) {
        e.hint = data["hint"].get<std::string>();
    }
    return e;
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
Response Response::Success(nlohmann::json id, nlohmann::json result) {
    Response r;
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

Response Response::Failure(nlohmann::json id, RpcError error) {
    Response r;
    r.id = std::move(id);
    r.error = std::move(error);
    return r;
}

// ---------------------------------------------------------------------------
// ToJson
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const Message& message) {
    nlohmann::json j = {{"jsonrpc", "2.0"}};

    if (const auto* req = std::get_if<Request>(&message)) {
        j["id"] = req->id;
        j["method"] = req->method;
        if (!req->params.is_null()) j["params"] = req->params;
    } else if (const auto* resp = std::get_if<Response>(&message)) {
        j["id"] = resp->id;
        if (resp->error.has_value()) {
            nlohmann::json err = {{"code", resp->error->code},
                                  {"message", resp->error->message}};
            if (!resp->error->data.is_null()) err["data"] = resp->error->data;
            j["error"] = std::move(err);
        } else {
            j["result"] = resp->result.value_or(nlohmann::json::object());
        }
    } else if (const auto* note = std::get_if<Notification>(&message)) {
        j["method"] = note->method;
        if (!note->params.is_null()) j["params"] = note->params;
    }
    return j;
}

// ---------------------------------------------------------------------------
// ParseMessage
// ---------------------------------------------------------------------------
Result<Message, Error> ParseMessage(const nlohmann::json& json) {
    using R = Result<Message, Error>;

    if (!json.is_object()) {
        return R::Err(Malformed("JSON-RPC message must be an object"));
    }
    auto version = json.find("jsonrpc");
    if (version == json.end() || *version != "2.0") {
        return R::Err(Malformed("Missing or invalid 'jsonrpc' version"));
    }

    auto method = json.find("method");
    auto id = json.find("id");

    if (method != json.end()) {
        if (!method->is_string()) {
            return R::Err(Malformed("'method' must be a string"));
        }
        nlohmann::json params = json.value("params", nlohmann::json());
        if (id == json.end()) {
            return R::Ok(Notification{method->get<std::string>(), std::move(params)});
        }
        if (!IsValidId(*id)) {
            return R::Err(Malformed("'id' must be an integer or string"));
        }
        return R::Ok(Request{*id, method->get<std::string>(), std::move(params)});
    }

    if (id == json.end()) {
        return R::Err(Malformed("Message has neither 'method' nor 'id'"));
    }
    if (!IsValidId(*id)) {
        return R::Err(Malformed("'id' must be an integer or string"));
    }

    auto result = json.find("result");
    auto error = json.find("error");
    if ((result == json.end()) == (error == json.end())) {
        return R::Err(Malformed("Response must carry exactly one of 'result' or 'error'"));
    }

    if (result != json.end()) {
        return R::Ok(Response::Success(*id, *result));
    }

    if (!error->is_object() || !error->contains("code") ||
        !(*error)["code"].is_number_integer()) {
        return R::Err(Malformed("'error' must be an object with an integer 'code'"));
    }
    RpcError rpc;
    rpc.code = (*error)["code"].get<int>();
    rpc.message = error->value("message", "");
    rpc.data = error->value("data", nlohmann::json());
    return R::Ok(Response::Failure(*id, std::move(rpc)));
}

} // namespace mcpfs

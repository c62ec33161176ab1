#include <catch2/catch_test_macros.hpp>

#include <mcpfs/mcp/mcp_server.hpp>

#include <chrono>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcpfs;

namespace {

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    auto echo = registry.Register(
        ToolDescriptor{"echo", "Echo the input",
                       {ToolParameter{"message", ParamType::String, "Text", true}}},
        [](const nlohmann::json& params) {
            return Result<ToolResult, Error>::Ok(
                ToolResult::Text(params["message"].get<std::string>()));
        });
    REQUIRE(echo.IsOk());

    auto slow = registry.Register(
        ToolDescriptor{"slow", "Sleep, then echo",
                       {ToolParameter{"ms", ParamType::Integer, "Delay", true},
                        ToolParameter{"tag", ParamType::String, "Reply", true}}},
        [](const nlohmann::json& params) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(params["ms"].get<int>()));
            return Result<ToolResult, Error>::Ok(
                ToolResult::Text(params["tag"].get<std::string>()));
        });
    REQUIRE(slow.IsOk());

    auto soft_fail = registry.Register(
        ToolDescriptor{"soft_fail", "Returns an error result", {}},
        [](const nlohmann::json&) {
            auto r = ToolResult::Text("something went wrong");
            r.is_error = true;
            return Result<ToolResult, Error>::Ok(r);
        });
    REQUIRE(soft_fail.IsOk());
    return registry;
}

nlohmann::json MakeRequest(nlohmann::json id, const std::string& method,
                           nlohmann::json params = nullptr) {
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) msg["params"] = params;
    return msg;
}

nlohmann::json CallTool(int id, const std::string& name, nlohmann::json arguments) {
    return MakeRequest(id, "tools/call", {{"name", name}, {"arguments", arguments}});
}

std::vector<nlohmann::json> ParseLines(const std::string& output) {
    std::vector<nlohmann::json> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

// Responses keyed by id.dump(); null ids collect under "null".
std::multimap<std::string, nlohmann::json> ById(const std::vector<nlohmann::json>& lines) {
    std::multimap<std::string, nlohmann::json> out;
    for (const auto& l : lines) {
        out.emplace(l["id"].dump(), l);
    }
    return out;
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);
    CHECK_FALSE(server.Initialized());

    auto response = server.HandleMessage(MakeRequest(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "1"}}}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "mcpfs");
    CHECK(r["result"]["serverInfo"].contains("version"));
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.Initialized());
}

TEST_CASE("McpServer: server name comes from options", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    ServerOptions options;
    options.server_name = "files";
    McpServer server(MakeTestRegistry(), options, in, out);

    auto response = server.HandleMessage(MakeRequest(1, "initialize"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["serverInfo"]["name"] == "files");
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(MakeRequest(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.is_array());
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["required"] == nlohmann::json::array({"message"}));
}

TEST_CASE("McpServer: tools/call executes tool", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(CallTool(3, "echo", {{"message", "hello"}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["id"] == 3);
    REQUIRE(r.contains("result"));
    CHECK(r["result"]["content"][0]["type"] == "text");
    CHECK(r["result"]["content"][0]["text"] == "hello");
    CHECK_FALSE(r["result"].contains("isError"));
}

TEST_CASE("McpServer: tool error result sets isError", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(CallTool(4, "soft_fail", nlohmann::json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    CHECK((*response)["result"]["content"][0]["text"] == "something went wrong");
}

TEST_CASE("McpServer: tools/call unknown tool returns error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(CallTool(5, "nonexistent", nlohmann::json::object()));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["id"] == 5);
    REQUIRE(r.contains("error"));
    CHECK(r["error"]["code"] == -32602);
    CHECK(r["error"]["message"] == "Unknown tool: nonexistent");
    CHECK(r["error"]["data"]["category"] == "unknown_tool");
}

TEST_CASE("McpServer: tools/call with bad arguments returns -32602", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(CallTool(6, "echo", {{"message", 12}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["data"]["category"] == "invalid_arguments");
}

TEST_CASE("McpServer: tools/call missing name returns error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(MakeRequest(7, "tools/call", {{"arguments", {}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Missing 'name' parameter");
}

TEST_CASE("McpServer: ping returns empty result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(MakeRequest("p1", "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == "p1");
    CHECK((*response)["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: unknown method returns error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(MakeRequest(8, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("McpServer: notification returns no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK_FALSE(response.has_value());
}

TEST_CASE("McpServer: invalid request returns -32600", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);

    auto response = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 9}, {"method", "ping"}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 9);
    CHECK((*response)["error"]["code"] == -32600);
}

// ===========================================================================
// Run
// ===========================================================================

TEST_CASE("McpServer: Run processes multiple messages", "[mcp][server]") {
    std::string input;
    input += MakeRequest(1, "initialize").dump() + "\n";
    input += R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n";
    input += MakeRequest(2, "tools/list").dump() + "\n";
    input += CallTool(3, "echo", {{"message", "hi"}}).dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 3);
    auto by_id = ById(lines);
    CHECK(by_id.find("1")->second["result"]["protocolVersion"] == "2024-11-05");
    CHECK(by_id.find("2")->second["result"]["tools"].size() == 3);
    CHECK(by_id.find("3")->second["result"]["content"][0]["text"] == "hi");
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("McpServer: Run handles parse errors", "[mcp][server]") {
    std::string input = "this is not json\n" + MakeRequest(1, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"].is_null());
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[0]["error"]["data"]["category"] == "malformed_frame");
    CHECK(lines[1]["id"] == 1);
    CHECK(lines[1]["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: Run rejects oversized frames and keeps going", "[mcp][server]") {
    ServerOptions options;
    options.max_frame_bytes = 64;
    std::string input = CallTool(1, "echo", {{"message", std::string(200, 'x')}}).dump() +
                        "\n" + MakeRequest(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), options, in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[1]["id"] == 2);
}

TEST_CASE("McpServer: Run survives a non-string clientInfo name", "[mcp][server]") {
    std::string input =
        MakeRequest(1, "initialize", {{"clientInfo", {{"name", 5}}}}).dump() + "\n" +
        MakeRequest(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);
    REQUIRE_NOTHROW(server.Run());

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    auto by_id = ById(lines);
    CHECK(by_id.find("1")->second["result"]["protocolVersion"] == "2024-11-05");
    CHECK(by_id.find("2")->second["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: tool throwing a non-standard exception is answered", "[mcp][server]") {
    auto registry = MakeTestRegistry();
    REQUIRE(registry.Register(
        ToolDescriptor{"throw_int", "Throws an int", {}},
        [](const nlohmann::json&) -> Result<ToolResult, Error> { throw 42; }).IsOk());

    std::string input = CallTool(1, "throw_int", nlohmann::json::object()).dump() + "\n" +
                        MakeRequest(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(std::move(registry), ServerOptions{}, in, out);
    REQUIRE_NOTHROW(server.Run());

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    auto by_id = ById(lines);
    const auto& failed = by_id.find("1")->second;
    CHECK(failed["error"]["code"] == -32603);
    CHECK(failed["error"]["data"]["category"] == "handler_execution");
    CHECK(by_id.find("2")->second["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: concurrent calls may complete out of order", "[mcp][server]") {
    std::string input;
    input += CallTool(1, "slow", {{"ms", 300}, {"tag", "slow"}}).dump() + "\n";
    input += CallTool(2, "slow", {{"ms", 0}, {"tag", "fast"}}).dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    ServerOptions options;
    options.max_workers = 2;
    McpServer server(MakeTestRegistry(), options, in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 2);
    CHECK(lines[0]["result"]["content"][0]["text"] == "fast");
    CHECK(lines[1]["id"] == 1);
    CHECK(lines[1]["result"]["content"][0]["text"] == "slow");
}

TEST_CASE("McpServer: shutdown waits for in-flight calls and stops reading", "[mcp][server]") {
    std::string input;
    input += CallTool(1, "slow", {{"ms", 100}, {"tag", "done"}}).dump() + "\n";
    input += MakeRequest(2, "shutdown").dump() + "\n";
    input += MakeRequest(3, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), ServerOptions{}, in, out);
    server.Run();

    auto by_id = ById(ParseLines(out.str()));
    CHECK(by_id.count("1") == 1);
    CHECK(by_id.count("2") == 1);
    CHECK(by_id.count("3") == 0);
    CHECK(by_id.find("1")->second["result"]["content"][0]["text"] == "done");
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("ServerStateName: lower-case names", "[mcp][server]") {
    CHECK(std::string(ServerStateName(ServerState::Idle)) == "idle");
    CHECK(std::string(ServerStateName(ServerState::Stopped)) == "stopped");
}

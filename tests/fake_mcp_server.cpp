// Minimal stdio MCP server used by the stdio backend tests.
//
// Tools: echo (returns its arguments), env (returns $FAKE_MCP_VALUE),
// cwd (returns the working directory), fail (isError result), crash (exits).
// tools/list is served in two pages.

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

static void Send(const nlohmann::json& j) {
  std::cout << j.dump() << "\n" << std::flush;
}

static nlohmann::json Tool(const std::string& name) {
  return {{"name", name}, {"description", "fake " + name}, {"inputSchema", {{"type", "object"}}}};
}

static nlohmann::json Text(const std::string& text) {
  return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

}  // namespace

int main() {
  std::cerr << "fake_mcp_server ready" << std::endl;
  std::string line;
  while (std::getline(std::cin, line)) {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) continue;
    if (!msg.contains("id")) continue;
    const auto id = msg["id"];
    const std::string method = msg.value("method", std::string());

    // Unrelated traffic the client has to skip.
    Send({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "debug"}}}});

    nlohmann::json result;
    if (method == "initialize") {
      result = {{"protocolVersion", "2024-11-05"},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", "fake"}, {"version", "1"}}}};
    } else if (method == "tools/list") {
      const auto& params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
      if (params.value("cursor", std::string()) == "page2") {
        result = {{"tools", nlohmann::json::array({Tool("fail"), Tool("crash")})}};
      } else {
        result = {{"tools", nlohmann::json::array({Tool("echo"), Tool("env"), Tool("cwd")})}, {"nextCursor", "page2"}};
      }
    } else if (method == "tools/call") {
      const auto& params = msg["params"];
      const std::string name = params.value("name", std::string());
      if (name == "echo") {
        result = {{"content", Text(params["arguments"].dump())}};
      } else if (name == "env") {
        const char* v = std::getenv("FAKE_MCP_VALUE");
        result = {{"content", Text(v ? v : "")}};
      } else if (name == "cwd") {
        char buf[4096];
        result = {{"content", Text(::getcwd(buf, sizeof(buf)) ? buf : "")}};
      } else if (name == "fail") {
        result = {{"content", Text("tool failed")}, {"isError", true}};
      } else if (name == "crash") {
        return 3;
      } else {
        Send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32602}, {"message", "Unknown tool: " + name}}}});
        continue;
      }
    } else {
      Send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32601}, {"message", "Method not found"}}}});
      continue;
    }
    Send({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
  }
  return 0;
}

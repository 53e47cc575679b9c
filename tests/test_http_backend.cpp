#include <gtest/gtest.h>

#include "backends/http_backend.hpp"
#include "json_rpc.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using gateway::HttpBackend;
using nlohmann::json;

// A small MCP endpoint served in-process on an ephemeral port.
class HttpBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) { Handle(req, res); });
    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    for (int i = 0; i < 200 && !server_.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(server_.is_running());
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  std::unique_ptr<HttpBackend> MakeBackend() {
    std::string err;
    auto ep = gateway::ParseHttpEndpoint("http://127.0.0.1:" + std::to_string(port_) + "/mcp", &err);
    EXPECT_TRUE(ep.has_value()) << err;
    auto backend = std::make_unique<HttpBackend>("remote", *ep, std::map<std::string, std::string>{{"X-Api-Key", "k1"}});
    backend->SetTimeouts(2, 5, 5);
    return backend;
  }

  void Handle(const httplib::Request& req, httplib::Response& res) {
    auto msg = json::parse(req.body, nullptr, false);
    {
      std::lock_guard<std::mutex> lock(mu_);
      methods_.push_back(msg.value("method", std::string()));
      session_headers_.push_back(req.get_header_value("Mcp-Session-Id"));
      api_keys_.push_back(req.get_header_value("X-Api-Key"));
    }
    if (!msg.contains("id")) {
      res.status = 202;
      return;
    }
    const std::string method = msg.value("method", std::string());
    json response;
    if (method == "initialize") {
      res.set_header("Mcp-Session-Id", "sess-1");
      response = gateway::jsonrpc::MakeResult(
          msg["id"], {{"protocolVersion", "2024-11-05"}, {"serverInfo", {{"name", "remote"}}}});
    } else if (method == "tools/list") {
      const std::string cursor = msg["params"].is_object() ? msg["params"].value("cursor", std::string()) : "";
      if (cursor.empty()) {
        response = gateway::jsonrpc::MakeResult(
            msg["id"], {{"tools", json::array({{{"name", "search"}, {"description", "find"}}})}, {"nextCursor", "p2"}});
      } else {
        response = gateway::jsonrpc::MakeResult(
            msg["id"], {{"tools", json::array({{{"name", "fetch"}, {"inputSchema", {{"type", "object"}}}}})}});
      }
    } else if (method == "tools/call") {
      const std::string name = msg["params"].value("name", std::string());
      if (name == "missing") {
        response = gateway::jsonrpc::MakeError(msg["id"], gateway::jsonrpc::kInvalidParams, "Unknown tool: missing");
      } else {
        json result = {{"content", json::array({{{"type", "text"}, {"text", msg["params"]["arguments"].dump()}}})}};
        if (name == "broken") result["isError"] = true;
        response = gateway::jsonrpc::MakeResult(msg["id"], result);
      }
    } else {
      response = gateway::jsonrpc::MakeError(msg["id"], gateway::jsonrpc::kMethodNotFound, "Method not found");
    }

    if (event_stream_.load()) {
      json noise = gateway::jsonrpc::MakeNotification("notifications/progress", {{"progress", 1}});
      res.set_content("event: message\ndata: " + noise.dump() + "\n\nevent: message\ndata: " + response.dump() + "\n\n",
                      "text/event-stream");
    } else {
      res.set_content(response.dump(), "application/json");
    }
  }

  httplib::Server server_;
  int port_ = 0;
  std::thread thread_;
  std::atomic<bool> event_stream_{false};

  std::mutex mu_;
  std::vector<std::string> methods_;
  std::vector<std::string> session_headers_;
  std::vector<std::string> api_keys_;
};

TEST_F(HttpBackendTest, HandshakeCapturesSessionId) {
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  EXPECT_EQ(backend->SessionId(), "sess-1");

  std::lock_guard<std::mutex> lock(mu_);
  ASSERT_EQ(methods_.size(), 2u);
  EXPECT_EQ(methods_[0], "initialize");
  EXPECT_EQ(methods_[1], "notifications/initialized");
  EXPECT_TRUE(session_headers_[0].empty());
  EXPECT_EQ(session_headers_[1], "sess-1");
  EXPECT_EQ(api_keys_[0], "k1");
}

TEST_F(HttpBackendTest, DiscoversEveryPage) {
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  auto tools = backend->DiscoverTools(&err);
  ASSERT_TRUE(tools.has_value()) << err;
  ASSERT_EQ(tools->size(), 2u);
  EXPECT_EQ((*tools)[0].name, "search");
  EXPECT_EQ((*tools)[0].description, "find");
  EXPECT_EQ((*tools)[1].name, "fetch");
  EXPECT_EQ((*tools)[1].input_schema["type"], "object");
}

TEST_F(HttpBackendTest, CallReplaysSessionAndReturnsResult) {
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  auto result = backend->CallTool("search", {{"q", "cats"}}, &err);
  ASSERT_TRUE(result.has_value()) << err;
  EXPECT_EQ(json::parse((*result)["content"][0]["text"].get<std::string>()), json({{"q", "cats"}}));

  std::lock_guard<std::mutex> lock(mu_);
  EXPECT_EQ(session_headers_.back(), "sess-1");
}

TEST_F(HttpBackendTest, ApplicationErrorIsReturnedAsResult) {
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  auto result = backend->CallTool("broken", json::object(), &err);
  ASSERT_TRUE(result.has_value()) << err;
  EXPECT_EQ((*result)["isError"], true);
}

TEST_F(HttpBackendTest, RpcErrorIsTransportFailure) {
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  EXPECT_FALSE(backend->CallTool("missing", json::object(), &err).has_value());
  EXPECT_NE(err.find("Unknown tool: missing"), std::string::npos);
}

TEST_F(HttpBackendTest, DecodesEventStreamResponses) {
  event_stream_ = true;
  auto backend = MakeBackend();
  std::string err;
  ASSERT_TRUE(backend->Start(&err)) << err;
  auto tools = backend->DiscoverTools(&err);
  ASSERT_TRUE(tools.has_value()) << err;
  EXPECT_EQ(tools->size(), 2u);
  auto result = backend->CallTool("search", {{"q", 1}}, &err);
  ASSERT_TRUE(result.has_value()) << err;
}

TEST_F(HttpBackendTest, UnreachableEndpointFailsStart) {
  server_.stop();
  thread_.join();
  auto backend = MakeBackend();
  std::string err;
  EXPECT_FALSE(backend->Start(&err));
  EXPECT_NE(err.find("failed to connect"), std::string::npos);
}

TEST(EventStreamTest, PicksResponseByIdAcrossEvents) {
  const std::string body =
      "event: message\n"
      "data: {\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"n\":1}}\n"
      "\n"
      "data: {\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"n\":2}}\n"
      "\n";
  EXPECT_EQ(gateway::DecodeEventStreamResponse(body, 2)["result"]["n"], 2);
  EXPECT_TRUE(gateway::DecodeEventStreamResponse(body, 3).is_discarded());
}

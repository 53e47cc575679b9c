#include <gtest/gtest.h>

#include "json_rpc.hpp"

using nlohmann::json;
namespace jsonrpc = gateway::jsonrpc;

TEST(JsonRpcEnvelopeTest, AcceptsRequest) {
  json err;
  auto env = jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})"), &err);
  ASSERT_TRUE(env.has_value());
  EXPECT_TRUE(env->has_id);
  EXPECT_EQ(env->id, 7);
  EXPECT_EQ(env->method, "tools/list");
  EXPECT_TRUE(env->params.is_null());
}

TEST(JsonRpcEnvelopeTest, NotificationHasNoId) {
  json err;
  auto env = jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"), &err);
  ASSERT_TRUE(env.has_value());
  EXPECT_FALSE(env->has_id);
}

TEST(JsonRpcEnvelopeTest, NullIdStillMakesARequest) {
  json err;
  auto env = jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"2.0","id":null,"method":"x"})"), &err);
  ASSERT_TRUE(env.has_value());
  EXPECT_TRUE(env->has_id);
}

TEST(JsonRpcEnvelopeTest, NonObjectIsInvalidRequest) {
  json err;
  EXPECT_FALSE(jsonrpc::ValidateEnvelope(json::parse("[1,2]"), &err).has_value());
  EXPECT_EQ(err["error"]["code"], jsonrpc::kInvalidRequest);
  EXPECT_TRUE(err["id"].is_null());
}

TEST(JsonRpcEnvelopeTest, WrongVersionEchoesId) {
  json err;
  EXPECT_FALSE(jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"1.0","id":"a","method":"x"})"), &err).has_value());
  EXPECT_EQ(err["error"]["code"], jsonrpc::kInvalidRequest);
  EXPECT_EQ(err["id"], "a");
}

TEST(JsonRpcEnvelopeTest, WrongVersionWithoutIdAnswersWithNullId) {
  json err;
  EXPECT_FALSE(jsonrpc::ValidateEnvelope(json::parse(R"({"method":"x"})"), &err).has_value());
  EXPECT_EQ(err["error"]["code"], jsonrpc::kInvalidRequest);
  EXPECT_TRUE(err["id"].is_null());
}

TEST(JsonRpcEnvelopeTest, MissingMethodOnlyAnsweredWithId) {
  json err;
  EXPECT_FALSE(jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"2.0","id":3})"), &err).has_value());
  EXPECT_EQ(err["error"]["code"], jsonrpc::kInvalidRequest);
  EXPECT_EQ(err["id"], 3);

  json silent;
  EXPECT_FALSE(jsonrpc::ValidateEnvelope(json::parse(R"({"jsonrpc":"2.0","method":""})"), &silent).has_value());
  EXPECT_TRUE(silent.is_null());
}

TEST(JsonRpcResultTest, ExtractsResult) {
  std::string err;
  auto r = jsonrpc::ExtractResult(jsonrpc::MakeResult(1, {{"ok", true}}), &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)["ok"], true);
}

TEST(JsonRpcResultTest, ReportsErrorObject) {
  std::string err;
  auto r = jsonrpc::ExtractResult(jsonrpc::MakeError(1, -32601, "Method not found"), &err);
  EXPECT_FALSE(r.has_value());
  EXPECT_NE(err.find("Method not found"), std::string::npos);
  EXPECT_NE(err.find("-32601"), std::string::npos);
}

TEST(JsonRpcResultTest, MissingResultIsAnError) {
  std::string err;
  EXPECT_FALSE(jsonrpc::ExtractResult(json{{"jsonrpc", "2.0"}, {"id", 1}}, &err).has_value());
  EXPECT_EQ(err, "missing result");
}

TEST(JsonRpcBuildTest, NotificationCarriesNoId) {
  auto n = jsonrpc::MakeNotification("notifications/initialized", nullptr);
  EXPECT_FALSE(n.contains("id"));
  EXPECT_FALSE(n.contains("params"));
  EXPECT_EQ(n["jsonrpc"], "2.0");
}

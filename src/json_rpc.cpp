#include "json_rpc.hpp"

namespace gateway {
namespace jsonrpc {

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["result"] = result;
  return j;
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = {{"code", code}, {"message", message}};
  return j;
}

nlohmann::json MakeRequest(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["method"] = method;
  if (!params.is_null()) j["params"] = params;
  return j;
}

nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  if (!params.is_null()) j["params"] = params;
  return j;
}

std::optional<Envelope> ValidateEnvelope(const nlohmann::json& msg, nlohmann::json* error_response) {
  if (!msg.is_object()) {
    if (error_response) *error_response = MakeError(nullptr, kInvalidRequest, "Invalid Request");
    return std::nullopt;
  }

  Envelope env;
  env.has_id = msg.contains("id");
  if (env.has_id) env.id = msg["id"];

  if (!msg.contains("jsonrpc") || !msg["jsonrpc"].is_string() || msg["jsonrpc"].get<std::string>() != "2.0") {
    if (error_response) *error_response = MakeError(env.has_id ? env.id : nlohmann::json(), kInvalidRequest, "Invalid Request");
    return std::nullopt;
  }

  if (!msg.contains("method") || !msg["method"].is_string() || msg["method"].get<std::string>().empty()) {
    if (env.has_id && error_response) *error_response = MakeError(env.id, kInvalidRequest, "Invalid Request");
    return std::nullopt;
  }

  env.method = msg["method"].get<std::string>();
  env.params = msg.contains("params") ? msg["params"] : nlohmann::json();
  return env;
}

std::optional<nlohmann::json> ExtractResult(const nlohmann::json& resp, std::string* err) {
  if (!resp.is_object()) {
    if (err) *err = "invalid json-rpc response";
    return std::nullopt;
  }
  if (resp.contains("error") && resp["error"].is_object()) {
    const auto& e = resp["error"];
    std::string msg;
    if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
    if (msg.empty()) msg = "json-rpc error";
    if (e.contains("code") && e["code"].is_number_integer()) msg += " (code " + std::to_string(e["code"].get<int>()) + ")";
    if (err) *err = msg;
    return std::nullopt;
  }
  if (!resp.contains("result")) {
    if (err) *err = "missing result";
    return std::nullopt;
  }
  return resp["result"];
}

}  // namespace jsonrpc
}  // namespace gateway

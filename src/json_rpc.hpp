#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace gateway {
namespace jsonrpc {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json MakeRequest(const nlohmann::json& id, const std::string& method, const nlohmann::json& params);
nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params);

// A validated inbound envelope. has_id distinguishes Request from Notification.
struct Envelope {
  bool has_id = false;
  nlohmann::json id;
  std::string method;
  nlohmann::json params;
};

// Structural validation of a parsed message. On failure returns nullopt and,
// when a response is owed, fills *error_response.
std::optional<Envelope> ValidateEnvelope(const nlohmann::json& msg, nlohmann::json* error_response);

// Pulls `result` out of a response; on an error object or malformed response
// returns nullopt and sets *err.
std::optional<nlohmann::json> ExtractResult(const nlohmann::json& resp, std::string* err);

}  // namespace jsonrpc
}  // namespace gateway

#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace gateway {

struct SanitizedCall {
  nlohmann::json params;
  std::optional<std::string> bridge_token;
};

// Removes the `_bridge` envelope from tools/call params, both at the params
// level and inside `arguments`. The returned params never carry a token.
SanitizedCall SanitizeToolCall(const nlohmann::json& params);

struct CorrelationIds {
  std::string ui_session_id;
  std::string ui_rpc_id;
  std::string correlation_id;
  std::string tool_call_fingerprint;
};

nlohmann::json CorrelationIdsToJson(const CorrelationIds& ids);

uint64_t Fnv1a64(const std::string& data);
std::string UiSessionIdFromToken(const std::optional<std::string>& token);
std::string ToolCallFingerprint(const std::string& tool_name, const nlohmann::json& arguments);
std::string RandomHex128();

class Correlator {
 public:
  CorrelationIds Generate(const std::optional<std::string>& token,
                          const nlohmann::json& rpc_id,
                          const std::string& tool_name,
                          const nlohmann::json& arguments);

 private:
  std::atomic<uint64_t> seq_{0};
};

}  // namespace gateway

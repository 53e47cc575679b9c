#include "bridge.hpp"

#include <cstdio>
#include <random>

namespace gateway {
namespace {

constexpr const char* kBridgeKey = "_bridge";

static std::string Hex64(uint64_t v) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return buf;
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::optional<std::string> TakeBridgeToken(nlohmann::json* obj) {
  if (!obj->is_object() || !obj->contains(kBridgeKey)) return std::nullopt;
  std::optional<std::string> token;
  const auto& bridge = (*obj)[kBridgeKey];
  if (bridge.is_object() && bridge.contains("sessionToken") && bridge["sessionToken"].is_string()) {
    token = bridge["sessionToken"].get<std::string>();
  }
  obj->erase(kBridgeKey);
  return token;
}

}  // namespace

SanitizedCall SanitizeToolCall(const nlohmann::json& params) {
  SanitizedCall out;
  out.params = params;
  out.bridge_token = TakeBridgeToken(&out.params);
  if (out.params.is_object() && out.params.contains("arguments")) {
    auto nested = TakeBridgeToken(&out.params["arguments"]);
    if (!out.bridge_token) out.bridge_token = std::move(nested);
  }
  return out;
}

nlohmann::json CorrelationIdsToJson(const CorrelationIds& ids) {
  return {{"uiSessionId", ids.ui_session_id},
          {"uiRpcId", ids.ui_rpc_id},
          {"correlationId", ids.correlation_id},
          {"toolCallFingerprint", ids.tool_call_fingerprint}};
}

uint64_t Fnv1a64(const std::string& data) {
  uint64_t h = 14695981039346656037ULL;
  for (unsigned char c : data) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

std::string UiSessionIdFromToken(const std::optional<std::string>& token) {
  if (!token || token->empty()) return "ui_unknown";
  return "ui_" + Hex64(Fnv1a64(*token));
}

std::string ToolCallFingerprint(const std::string& tool_name, const nlohmann::json& arguments) {
  // nlohmann::json objects are key-sorted, so dump() is already canonical.
  return "fp_" + Hex64(Fnv1a64(tool_name + "\n" + arguments.dump()));
}

std::string RandomHex128() {
  return Hex64(Rand64()) + Hex64(Rand64());
}

CorrelationIds Correlator::Generate(const std::optional<std::string>& token,
                                    const nlohmann::json& rpc_id,
                                    const std::string& tool_name,
                                    const nlohmann::json& arguments) {
  CorrelationIds ids;
  ids.ui_session_id = UiSessionIdFromToken(token);
  const std::string id_text = rpc_id.is_string() ? rpc_id.get<std::string>() : rpc_id.dump();
  ids.ui_rpc_id = "rpc_" + id_text + "_" + std::to_string(++seq_);
  ids.correlation_id = RandomHex128();
  ids.tool_call_fingerprint = ToolCallFingerprint(tool_name, arguments);
  return ids;
}

}  // namespace gateway

#include "ipc/ipc_protocol.hpp"

#include <sys/un.h>

#include <chrono>
#include <random>

namespace gateway {
namespace {

static std::vector<std::string> StringList(const nlohmann::json& j) {
  std::vector<std::string> out;
  if (!j.is_array()) return out;
  for (const auto& v : j) {
    if (v.is_string()) out.push_back(v.get<std::string>());
  }
  return out;
}

}  // namespace

const char* IpcCommandName(IpcCommandType type) {
  switch (type) {
    case IpcCommandType::kReload:
      return "reload";
    case IpcCommandType::kStop:
      return "stop";
    case IpcCommandType::kStatus:
      return "status";
  }
  return "unknown";
}

std::optional<IpcCommandType> ParseIpcCommandName(const std::string& name) {
  if (name == "reload") return IpcCommandType::kReload;
  if (name == "stop") return IpcCommandType::kStop;
  if (name == "status") return IpcCommandType::kStatus;
  return std::nullopt;
}

nlohmann::json ReloadResultToJson(const ReloadResult& r) {
  nlohmann::json j;
  j["success"] = r.success;
  j["reloadedConnectors"] = r.reloaded_connectors;
  j["failedConnectors"] = r.failed_connectors;
  if (!r.message.empty()) j["message"] = r.message;
  return j;
}

std::optional<ReloadResult> ReloadResultFromJson(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("success") || !j["success"].is_boolean()) return std::nullopt;
  ReloadResult r;
  r.success = j["success"].get<bool>();
  if (j.contains("reloadedConnectors")) r.reloaded_connectors = StringList(j["reloadedConnectors"]);
  if (j.contains("failedConnectors")) r.failed_connectors = StringList(j["failedConnectors"]);
  r.message = j.value("message", std::string());
  return r;
}

nlohmann::json IpcResponseToJson(const IpcResponse& r) {
  nlohmann::json j;
  j["type"] = r.type;
  if (!r.message.empty()) j["message"] = r.message;
  if (!r.data.is_null()) j["data"] = r.data;
  if (!r.error.empty()) j["error"] = r.error;
  return j;
}

IpcResponse IpcResponseFromJson(const nlohmann::json& j) {
  IpcResponse r;
  if (!j.is_object()) {
    r.type = "error";
    r.error = "Empty response";
    return r;
  }
  r.type = j.value("type", std::string());
  r.message = j.value("message", std::string());
  if (j.contains("data")) r.data = j["data"];
  r.error = j.value("error", std::string());
  return r;
}

std::string GenerateIpcRequestId() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  const auto now_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  std::string suffix;
  for (int i = 0; i < 8; i++) suffix.push_back(kAlphabet[rng() % 36]);
  return std::to_string(now_ms) + "-" + suffix;
}

nlohmann::json MakeIpcRequest(const std::string& id, IpcCommandType type) {
  return {{"id", id}, {"kind", "request"}, {"command", {{"type", IpcCommandName(type)}}}};
}

nlohmann::json MakeIpcResponse(const std::string& id, const IpcResponse& response) {
  return {{"id", id}, {"kind", "response"}, {"response", IpcResponseToJson(response)}};
}

uint32_t Djb2Hash(const std::string& s) {
  uint32_t hash = 5381;
  for (char c : s) hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
  return hash;
}

std::string SocketPathForConfigDir(const std::string& config_dir) {
  std::string path = config_dir;
  if (!path.empty() && path.back() != '/') path += "/";
  path += "gateway.sock";
  if (path.size() < sizeof(sockaddr_un{}.sun_path)) return path;
  return "/tmp/mcp-gateway-" + std::to_string(Djb2Hash(config_dir)) + ".sock";
}

}  // namespace gateway

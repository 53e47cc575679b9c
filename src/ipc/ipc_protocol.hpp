#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

enum class IpcCommandType { kReload, kStop, kStatus };

const char* IpcCommandName(IpcCommandType type);
std::optional<IpcCommandType> ParseIpcCommandName(const std::string& name);

struct ReloadResult {
  bool success = false;
  std::vector<std::string> reloaded_connectors;
  std::vector<std::string> failed_connectors;
  std::string message;
};

nlohmann::json ReloadResultToJson(const ReloadResult& r);
std::optional<ReloadResult> ReloadResultFromJson(const nlohmann::json& j);

// response.type is "ok", "status" or "error".
struct IpcResponse {
  std::string type;
  std::string message;
  nlohmann::json data;
  std::string error;
};

nlohmann::json IpcResponseToJson(const IpcResponse& r);
IpcResponse IpcResponseFromJson(const nlohmann::json& j);

std::string GenerateIpcRequestId();
nlohmann::json MakeIpcRequest(const std::string& id, IpcCommandType type);
nlohmann::json MakeIpcResponse(const std::string& id, const IpcResponse& response);

uint32_t Djb2Hash(const std::string& s);

// <config_dir>/gateway.sock, or a hashed name under /tmp when that path does
// not fit in sockaddr_un::sun_path.
std::string SocketPathForConfigDir(const std::string& config_dir);

}  // namespace gateway

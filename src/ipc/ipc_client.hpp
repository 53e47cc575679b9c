#pragma once

#include "ipc/ipc_protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace gateway {

// One connection per call: send a request line, wait for the response line
// with the same id, close.
class IpcClient {
 public:
  static constexpr int kDefaultTimeoutMs = 5000;

  explicit IpcClient(std::string socket_path, int timeout_ms = kDefaultTimeoutMs);

  std::optional<IpcResponse> Send(IpcCommandType type, std::string* err);

  std::optional<ReloadResult> Reload(std::string* err);
  // A connection closed before the reply counts as success.
  bool Stop(std::string* err);
  std::optional<nlohmann::json> Status(std::string* err);
  bool IsRunning();

  const std::string& SocketPath() const { return socket_path_; }

 private:
  std::optional<IpcResponse> SendImpl(IpcCommandType type, bool* closed_early, std::string* err);

  std::string socket_path_;
  int timeout_ms_;
};

}  // namespace gateway

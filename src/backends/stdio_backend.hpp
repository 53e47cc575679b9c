#pragma once

#include "backends/backend.hpp"
#include "config.hpp"
#include "frame_reader.hpp"

#include <sys/types.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gateway {

// A backend that runs as a child process and speaks newline-delimited
// JSON-RPC on its stdin/stdout. Requests are serialized; stderr is forwarded
// to the log.
class StdioBackend : public IBackend {
 public:
  StdioBackend(std::string name, StdioTransportConfig config);
  ~StdioBackend() override;

  StdioBackend(const StdioBackend&) = delete;
  StdioBackend& operator=(const StdioBackend&) = delete;

  std::string Name() const override { return name_; }

  bool Start(std::string* err) override;
  void Stop() override;

  std::optional<std::vector<BackendTool>> DiscoverTools(std::string* err) override;
  std::optional<nlohmann::json> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         std::string* err) override;

  // Bounds process start, the handshake and tools/list. Calls are unbounded.
  void SetDiscoveryTimeout(int seconds);

  pid_t Pid() const;

 private:
  bool SpawnLocked(std::string* err);
  void StopLocked();
  bool WriteLineLocked(const std::string& line, std::string* err);
  // timeout_ms < 0 waits forever.
  std::optional<nlohmann::json> RequestLocked(const std::string& method,
                                              const nlohmann::json& params,
                                              int timeout_ms,
                                              std::string* err);
  void ForwardStderr(int fd);

  std::string name_;
  StdioTransportConfig config_;
  int discovery_timeout_ms_ = 30000;

  mutable std::mutex mu_;
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  bool initialized_ = false;
  int64_t next_id_ = 1;
  FrameReader reader_;
  std::deque<std::string> pending_lines_;
  std::thread stderr_thread_;
};

}  // namespace gateway

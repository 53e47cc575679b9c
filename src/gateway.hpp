#pragma once

#include "audit.hpp"
#include "backends/factory.hpp"
#include "bridge.hpp"
#include "config.hpp"
#include "frame_reader.hpp"
#include "ipc/ipc_server.hpp"
#include "reload_coordinator.hpp"
#include "runtime_state.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gateway {

inline constexpr const char* kServerName = "mcp-gateway";
inline constexpr const char* kServerVersion = "0.1.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kUiProtocolVersion = "2025-11-21";
inline constexpr const char* kTraceViewerUri = "ui://mcp-gateway/trace-viewer";
inline constexpr const char* kUiMimeType = "text/html;profile=mcp-app";
inline constexpr size_t kMaxUriLength = 2048;

// Owns every gateway component and serves the primary channel.
//
// Messages are handled in arrival order on the thread that calls Run (or
// Feed). The control channel runs on its own threads and only touches the
// reload coordinator and the runtime state.
class Gateway {
 public:
  using Writer = std::function<void(const std::string& line)>;
  using StoppedCallback = std::function<void()>;

  Gateway(GatewayConfig config,
          ConnectorLoader loader,
          BackendFactory factory,
          std::shared_ptr<IAuditSink> audit = nullptr);
  ~Gateway();

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  // Loads the connectors, preloads every backend, seeds the runtime state and
  // starts the heartbeat and the control channel. Fails only when the
  // initial configuration cannot be read.
  bool Start(std::string* err);

  // Serves in_fd until EOF or a stop request, then shuts down. Responses go
  // to the writer if one is set, else to out_fd.
  int Run(int in_fd, int out_fd);

  void Feed(const char* data, size_t size);
  std::optional<nlohmann::json> HandleLine(const std::string& line);
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& msg);

  void SetWriter(Writer writer);
  void OnStopped(StoppedCallback callback);

  // Asks the serve loop to shut down; shuts down directly when no loop runs.
  void RequestStop();
  // Heartbeat, control channel, runtime state, primary channel, in that
  // order. Idempotent.
  void Shutdown();

  ReloadResult Reload() { return coordinator_.Reload(); }
  nlohmann::json Status() const { return state_.Snapshot(); }

  RuntimeStateManager& State() { return state_; }
  ReloadCoordinator& Coordinator() { return coordinator_; }
  const GatewayConfig& Config() const { return config_; }
  std::string SocketPath() const;
  bool Initialized() const { return initialized_.load(); }
  bool Stopped() const { return stopped_.load(); }
  bool IsValidSessionToken(const std::string& token) const;

 private:
  nlohmann::json Dispatch(const std::string& method, const nlohmann::json& id, const nlohmann::json& params);
  void DispatchNotification(const std::string& method, const nlohmann::json& params);

  nlohmann::json HandleInitialize(const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json HandleToolsList(const nlohmann::json& id);
  nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json HandleResourcesList(const nlohmann::json& id);
  nlohmann::json HandleResourcesRead(const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json HandleUiInitialize(const nlohmann::json& id);

  void WarnIfUninitialized(const std::string& method) const;
  void Write(const nlohmann::json& msg);
  std::string CurrentClient() const;

  GatewayConfig config_;
  std::shared_ptr<IAuditSink> audit_;
  RuntimeStateManager state_;
  ReloadCoordinator coordinator_;
  std::unique_ptr<IpcServer> ipc_;
  FrameReader reader_;
  Correlator correlator_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> loop_running_{false};
  std::atomic<bool> detached_{false};
  int wake_pipe_[2] = {-1, -1};
  int log_observer_id_ = 0;

  std::mutex out_mu_;
  Writer writer_;

  mutable std::mutex mu_;
  std::string client_name_;
  std::set<std::string> session_tokens_;
  std::vector<StoppedCallback> stopped_callbacks_;
};

}  // namespace gateway

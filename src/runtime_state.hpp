#pragma once

#include "tool_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gateway {

enum class ClientState { kActive, kIdle, kGone };

const char* ClientStateName(ClientState state);

struct ClientInfo {
  std::string name;
  std::string protocol_version = "unknown";
  ClientState state = ClientState::kActive;
  std::string connected_at;
  std::string last_seen;
  int64_t sessions = 1;
  int64_t tool_calls = 0;
};

// Fields left unset are not touched by UpdateClient.
struct ClientPatch {
  std::optional<std::string> protocol_version;
  std::optional<ClientState> state;
  std::optional<int64_t> sessions;
};

// Live snapshot of the running gateway: clients, connector health, log
// counters and a heartbeat. All methods are thread-safe. When a state path is
// set, every mutation and heartbeat is written there atomically.
class RuntimeStateManager {
 public:
  static constexpr int kDefaultHeartbeatMs = 5000;
  static constexpr int64_t kHeartbeatStaleMs = 30000;
  static constexpr int64_t kIdleThresholdMs = 30000;

  // An empty state_path disables persistence.
  explicit RuntimeStateManager(std::string state_path = {}, int heartbeat_interval_ms = kDefaultHeartbeatMs);
  ~RuntimeStateManager();

  RuntimeStateManager(const RuntimeStateManager&) = delete;
  RuntimeStateManager& operator=(const RuntimeStateManager&) = delete;

  void Initialize(const std::vector<ConnectorSummary>& connectors, const std::string& log_level, size_t max_log_lines);
  void SetConnectors(const std::vector<ConnectorSummary>& connectors);
  void UpdateClient(const std::string& name, const ClientPatch& patch);
  void RecordToolCall(const std::string& name);
  void UpdateLogCount(size_t count);

  void StartHeartbeat();
  void StopHeartbeat();
  void MarkStopped();

  nlohmann::json Snapshot() const;
  std::optional<ClientInfo> Client(const std::string& name) const;
  std::string Heartbeat() const;

  const std::string& StatePath() const { return state_path_; }

  static std::optional<nlohmann::json> ReadPersisted(const std::string& path);
  static bool IsAlive(const nlohmann::json& state);
  // Non-gone clients unseen for longer than the threshold report idle.
  static ClientState DetermineClientState(const nlohmann::json& client, int64_t idle_threshold_ms = kIdleThresholdMs);

 private:
  nlohmann::json SnapshotLocked() const;
  void Persist();
  void HeartbeatLoop();

  std::string state_path_;
  int heartbeat_interval_ms_;

  mutable std::mutex mu_;
  bool running_ = false;
  std::string started_at_;
  int64_t pid_ = 0;
  std::string heartbeat_;
  std::vector<ConnectorSummary> connectors_;
  std::map<std::string, ClientInfo> clients_;
  std::string log_level_ = "WARN";
  size_t buffered_lines_ = 0;
  size_t max_lines_ = 1000;

  std::mutex persist_mu_;

  std::mutex hb_mu_;
  std::condition_variable hb_cv_;
  bool hb_stop_ = false;
  std::thread hb_thread_;
};

std::string NowIso8601();
std::optional<int64_t> ParseIso8601Ms(const std::string& s);

}  // namespace gateway

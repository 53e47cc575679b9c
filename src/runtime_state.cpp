#include "runtime_state.hpp"

#include "logging.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <utility>

namespace gateway {
namespace {

static int64_t NowUnixMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static nlohmann::json ClientToJson(const ClientInfo& c) {
  return {{"name", c.name},
          {"protocolVersion", c.protocol_version},
          {"state", ClientStateName(c.state)},
          {"connectedAt", c.connected_at},
          {"lastSeen", c.last_seen},
          {"sessions", c.sessions},
          {"toolCalls", c.tool_calls}};
}

}  // namespace

std::string NowIso8601() {
  const int64_t ms = NowUnixMs();
  std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms % 1000));
  return out;
}

std::optional<int64_t> ParseIso8601Ms(const std::string& s) {
  std::tm tm{};
  int millis = 0;
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  if (static_cast<size_t>(consumed) < s.size() && s[consumed] == '.') {
    std::sscanf(s.c_str() + consumed, ".%3d", &millis);
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  const std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return static_cast<int64_t>(t) * 1000 + millis;
}

const char* ClientStateName(ClientState state) {
  switch (state) {
    case ClientState::kActive:
      return "active";
    case ClientState::kIdle:
      return "idle";
    case ClientState::kGone:
      return "gone";
  }
  return "active";
}

RuntimeStateManager::RuntimeStateManager(std::string state_path, int heartbeat_interval_ms)
    : state_path_(std::move(state_path)),
      heartbeat_interval_ms_(heartbeat_interval_ms > 0 ? heartbeat_interval_ms : kDefaultHeartbeatMs) {}

RuntimeStateManager::~RuntimeStateManager() {
  StopHeartbeat();
}

void RuntimeStateManager::Initialize(const std::vector<ConnectorSummary>& connectors,
                                     const std::string& log_level,
                                     size_t max_log_lines) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    const std::string now = NowIso8601();
    running_ = true;
    started_at_ = now;
    heartbeat_ = now;
    pid_ = static_cast<int64_t>(::getpid());
    connectors_ = connectors;
    clients_.clear();
    log_level_ = log_level;
    buffered_lines_ = 0;
    max_lines_ = max_log_lines;
  }
  Persist();
}

void RuntimeStateManager::SetConnectors(const std::vector<ConnectorSummary>& connectors) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    connectors_ = connectors;
  }
  Persist();
}

void RuntimeStateManager::UpdateClient(const std::string& name, const ClientPatch& patch) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    const std::string now = NowIso8601();
    auto it = clients_.find(name);
    if (it == clients_.end()) {
      ClientInfo c;
      c.name = name;
      c.connected_at = now;
      c.last_seen = now;
      if (patch.protocol_version) c.protocol_version = *patch.protocol_version;
      if (patch.state) c.state = *patch.state;
      if (patch.sessions) c.sessions = *patch.sessions;
      clients_.emplace(name, std::move(c));
    } else {
      ClientInfo& c = it->second;
      if (patch.protocol_version) c.protocol_version = *patch.protocol_version;
      if (patch.state) c.state = *patch.state;
      if (patch.sessions) c.sessions = *patch.sessions;
      c.last_seen = now;
      // Becoming active again without an explicit count is a new session.
      if (patch.state && *patch.state == ClientState::kActive && !patch.sessions) c.sessions += 1;
    }
  }
  Persist();
}

void RuntimeStateManager::RecordToolCall(const std::string& name) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = clients_.find(name);
    if (it == clients_.end()) return;
    it->second.tool_calls += 1;
    it->second.last_seen = NowIso8601();
    it->second.state = ClientState::kActive;
  }
  Persist();
}

void RuntimeStateManager::UpdateLogCount(size_t count) {
  // Left to the next heartbeat or mutation to persist.
  std::lock_guard<std::mutex> lock(mu_);
  buffered_lines_ = count;
}

void RuntimeStateManager::StartHeartbeat() {
  std::lock_guard<std::mutex> lock(hb_mu_);
  if (hb_thread_.joinable()) return;
  hb_stop_ = false;
  hb_thread_ = std::thread([this]() { HeartbeatLoop(); });
}

void RuntimeStateManager::StopHeartbeat() {
  std::thread t;
  {
    std::lock_guard<std::mutex> lock(hb_mu_);
    hb_stop_ = true;
    t = std::move(hb_thread_);
  }
  hb_cv_.notify_all();
  if (t.joinable()) t.join();
}

void RuntimeStateManager::HeartbeatLoop() {
  std::unique_lock<std::mutex> lock(hb_mu_);
  while (!hb_stop_) {
    if (hb_cv_.wait_for(lock, std::chrono::milliseconds(heartbeat_interval_ms_), [this]() { return hb_stop_; })) break;
    lock.unlock();
    {
      std::lock_guard<std::mutex> state_lock(mu_);
      heartbeat_ = NowIso8601();
    }
    Persist();
    lock.lock();
  }
}

void RuntimeStateManager::MarkStopped() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    running_ = false;
    for (auto& kv : clients_) kv.second.state = ClientState::kGone;
  }
  Persist();
}

nlohmann::json RuntimeStateManager::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return SnapshotLocked();
}

std::optional<ClientInfo> RuntimeStateManager::Client(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = clients_.find(name);
  if (it == clients_.end()) return std::nullopt;
  return it->second;
}

std::string RuntimeStateManager::Heartbeat() const {
  std::lock_guard<std::mutex> lock(mu_);
  return heartbeat_;
}

nlohmann::json RuntimeStateManager::SnapshotLocked() const {
  nlohmann::json j;
  j["version"] = 1;
  j["proxy"] = {{"state", running_ ? "RUNNING" : "STOPPED"},
                {"mode", "stdio"},
                {"startedAt", started_at_},
                {"pid", pid_},
                {"heartbeat", heartbeat_}};
  j["connectors"] = nlohmann::json::array();
  for (const auto& c : connectors_) j["connectors"].push_back(SummaryToJson(c));
  j["clients"] = nlohmann::json::object();
  for (const auto& kv : clients_) j["clients"][kv.first] = ClientToJson(kv.second);
  j["logging"] = {{"level", log_level_}, {"bufferedLines", buffered_lines_}, {"maxLines", max_lines_}};
  return j;
}

void RuntimeStateManager::Persist() {
  if (state_path_.empty()) return;
  const std::string body = Snapshot().dump(2);

  std::lock_guard<std::mutex> lock(persist_mu_);
  std::filesystem::path path(state_path_);
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      LogWarn("runtime-state", "cannot write " + tmp.string());
      return;
    }
    out << body;
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    LogWarn("runtime-state", "rename failed: " + ec.message());
    std::filesystem::remove(tmp, ec);
  }
}

std::optional<nlohmann::json> RuntimeStateManager::ReadPersisted(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  if (!j.contains("version") || j["version"] != 1) return std::nullopt;
  return j;
}

bool RuntimeStateManager::IsAlive(const nlohmann::json& state) {
  if (!state.is_object() || !state.contains("proxy") || !state["proxy"].is_object()) return false;
  const auto& proxy = state["proxy"];
  if (proxy.value("state", std::string()) != "RUNNING") return false;
  const std::string heartbeat = proxy.value("heartbeat", std::string());
  if (heartbeat.empty()) return false;

  const int64_t pid = proxy.value("pid", static_cast<int64_t>(0));
  if (pid > 0 && ::kill(static_cast<pid_t>(pid), 0) != 0 && errno != EPERM) return false;

  auto hb = ParseIso8601Ms(heartbeat);
  if (!hb) return false;
  return NowUnixMs() - *hb < kHeartbeatStaleMs;
}

ClientState RuntimeStateManager::DetermineClientState(const nlohmann::json& client, int64_t idle_threshold_ms) {
  if (!client.is_object()) return ClientState::kGone;
  if (client.value("state", std::string()) == "gone") return ClientState::kGone;
  auto last_seen = ParseIso8601Ms(client.value("lastSeen", std::string()));
  if (!last_seen) return ClientState::kIdle;
  return NowUnixMs() - *last_seen < idle_threshold_ms ? ClientState::kActive : ClientState::kIdle;
}

}  // namespace gateway

#include "gateway.hpp"

#include "json_rpc.hpp"
#include "logging.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kTraceViewerHtml = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>MCP Gateway Trace Viewer</title>
<style>
body { font-family: system-ui, sans-serif; margin: 0; padding: 12px; }
table { border-collapse: collapse; width: 100%; }
td, th { border-bottom: 1px solid #ddd; padding: 4px 8px; text-align: left; font-size: 13px; }
.err { color: #b00020; }
</style>
</head>
<body>
<h3>Tool call trace</h3>
<table id="events"><thead><tr><th>time</th><th>tool</th><th>status</th></tr></thead><tbody></tbody></table>
<script>
window.addEventListener("message", function (ev) {
  var data = ev.data || {};
  var result = data.result || data;
  var rows = (result.structuredContent && result.structuredContent.events) || [];
  var body = document.querySelector("#events tbody");
  body.innerHTML = "";
  rows.forEach(function (e) {
    var tr = document.createElement("tr");
    tr.innerHTML = "<td>" + (e.timestamp || "") + "</td><td>" + (e.type || "") + "</td><td>" + (e.rpcId || "") + "</td>";
    body.appendChild(tr);
  });
});
</script>
</body>
</html>
)HTML";

static int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

static bool WriteAll(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

Gateway::Gateway(GatewayConfig config,
                 ConnectorLoader loader,
                 BackendFactory factory,
                 std::shared_ptr<IAuditSink> audit)
    : config_(std::move(config)),
      audit_(audit ? std::move(audit) : std::make_shared<LogAuditSink>()),
      state_(config_.persist_state ? config_.config_dir + "/gateway-runtime-state.json" : std::string(),
             config_.heartbeat_interval_ms),
      coordinator_(std::move(loader), std::move(factory), &state_),
      reader_(config_.max_frame_bytes) {
  if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
    LogError("gateway", std::string("pipe() failed: ") + std::strerror(errno));
    wake_pipe_[0] = wake_pipe_[1] = -1;
  }
}

Gateway::~Gateway() {
  if (started_.load()) Shutdown();
  if (log_observer_id_ != 0) Logger::Instance().Buffer().RemoveObserver(log_observer_id_);
  for (int& fd : wake_pipe_) {
    if (fd >= 0) ::close(fd);
    fd = -1;
  }
}

bool Gateway::Start(std::string* err) {
  if (started_.load()) return true;

  Logger::Instance().SetVerbose(config_.verbose);
  Logger::Instance().Buffer().SetCapacity(config_.log_buffer_lines);

  try {
    coordinator_.LoadInitial();
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    LogError("gateway", std::string("cannot load configuration: ") + e.what());
    return false;
  }

  auto snapshot = coordinator_.Current();
  const auto summaries = snapshot ? snapshot->aggregator->Summaries() : std::vector<ConnectorSummary>();
  state_.Initialize(summaries, config_.verbose ? "INFO" : "WARN", Logger::Instance().Buffer().Capacity());
  state_.UpdateLogCount(Logger::Instance().Buffer().Size());
  log_observer_id_ = Logger::Instance().Buffer().AddObserver([this](size_t count) { state_.UpdateLogCount(count); });
  state_.StartHeartbeat();

  std::error_code ec;
  if (!config_.config_dir.empty()) std::filesystem::create_directories(config_.config_dir, ec);

  IpcHandlers handlers;
  handlers.on_reload = [this]() { return coordinator_.Reload(); };
  handlers.on_stop = [this]() { RequestStop(); };
  handlers.on_status = [this]() { return state_.Snapshot(); };
  ipc_ = std::make_unique<IpcServer>(SocketPathForConfigDir(config_.config_dir), std::move(handlers));
  std::string ipc_err;
  if (!ipc_->Start(&ipc_err)) {
    // The primary channel still works; only live control is lost.
    LogWarn("gateway", "control channel unavailable: " + ipc_err);
  }

  started_.store(true);
  LogInfo("gateway", "started connectors=" + std::to_string(summaries.size()));
  return true;
}

std::string Gateway::SocketPath() const {
  return SocketPathForConfigDir(config_.config_dir);
}

void Gateway::SetWriter(Writer writer) {
  std::lock_guard<std::mutex> lock(out_mu_);
  writer_ = std::move(writer);
}

void Gateway::OnStopped(StoppedCallback callback) {
  std::lock_guard<std::mutex> lock(mu_);
  stopped_callbacks_.push_back(std::move(callback));
}

bool Gateway::IsValidSessionToken(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_tokens_.count(token) > 0;
}

std::string Gateway::CurrentClient() const {
  std::lock_guard<std::mutex> lock(mu_);
  return client_name_;
}

void Gateway::Write(const nlohmann::json& msg) {
  if (detached_.load()) return;
  std::lock_guard<std::mutex> lock(out_mu_);
  if (writer_) writer_(msg.dump());
}

int Gateway::Run(int in_fd, int out_fd) {
  {
    std::lock_guard<std::mutex> lock(out_mu_);
    if (!writer_) {
      writer_ = [out_fd](const std::string& line) {
        if (!WriteAll(out_fd, line + "\n")) LogError("gateway", std::string("write failed: ") + std::strerror(errno));
      };
    }
  }

  loop_running_.store(true);
  char buf[65536];
  while (!stop_requested_.load()) {
    pollfd fds[2]{};
    fds[0].fd = in_fd;
    fds[0].events = POLLIN;
    fds[1].fd = wake_pipe_[0];
    fds[1].events = POLLIN;
    int ret = ::poll(fds, wake_pipe_[0] >= 0 ? 2 : 1, -1);
    if (ret < 0) {
      if (errno == EINTR) continue;
      LogError("gateway", std::string("poll() failed: ") + std::strerror(errno));
      break;
    }
    if (wake_pipe_[0] >= 0 && fds[1].revents != 0) break;
    if (fds[0].revents == 0) continue;

    ssize_t n = ::read(in_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      LogError("gateway", std::string("stdin error: ") + std::strerror(errno));
      break;
    }
    if (n == 0) {
      LogInfo("gateway", "stdin closed");
      const std::string client = CurrentClient();
      if (!client.empty()) {
        ClientPatch patch;
        patch.state = ClientState::kGone;
        state_.UpdateClient(client, patch);
      }
      break;
    }
    Feed(buf, static_cast<size_t>(n));
  }
  loop_running_.store(false);
  Shutdown();
  return 0;
}

void Gateway::RequestStop() {
  stop_requested_.store(true);
  if (!loop_running_.load()) {
    Shutdown();
    return;
  }
  if (wake_pipe_[1] >= 0) {
    const char b = 's';
    if (::write(wake_pipe_[1], &b, 1) < 0) LogWarn("gateway", std::string("wake write failed: ") + std::strerror(errno));
  }
}

void Gateway::Shutdown() {
  if (stopped_.exchange(true)) return;
  LogInfo("gateway", "stopping");
  state_.StopHeartbeat();
  if (ipc_) ipc_->Stop();
  state_.MarkStopped();
  detached_.store(true);
  if (log_observer_id_ != 0) {
    Logger::Instance().Buffer().RemoveObserver(log_observer_id_);
    log_observer_id_ = 0;
  }

  std::vector<StoppedCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    callbacks = stopped_callbacks_;
  }
  for (const auto& cb : callbacks) cb();
}

void Gateway::Feed(const char* data, size_t size) {
  if (detached_.load()) return;
  auto fed = reader_.Feed(data, size);
  for (const auto& line : fed.lines) {
    auto response = HandleLine(line);
    if (response) Write(*response);
  }
  if (fed.overflowed) {
    LogError("gateway", "buffer overflow: " + std::to_string(fed.overflow_bytes) + " bytes exceeds " +
                            std::to_string(reader_.MaxBytes()));
    Write(jsonrpc::MakeError(nullptr, jsonrpc::kInvalidRequest, "Message too large"));
  }
}

std::optional<nlohmann::json> Gateway::HandleLine(const std::string& line) {
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded()) {
    LogWarn("gateway", "parse error: " + TruncateForLog(line, 200));
    return jsonrpc::MakeError(nullptr, jsonrpc::kParseError, "Parse error");
  }
  return HandleMessage(msg);
}

std::optional<nlohmann::json> Gateway::HandleMessage(const nlohmann::json& msg) {
  nlohmann::json error_response;
  auto env = jsonrpc::ValidateEnvelope(msg, &error_response);
  if (!env) {
    if (error_response.is_null()) return std::nullopt;
    return error_response;
  }

  if (!env->has_id) {
    try {
      DispatchNotification(env->method, env->params);
    } catch (const std::exception& e) {
      LogError("gateway", "notification " + env->method + " failed: " + e.what());
    }
    return std::nullopt;
  }

  try {
    return Dispatch(env->method, env->id, env->params);
  } catch (const std::exception& e) {
    LogError("gateway", env->method + " failed: " + e.what());
    return jsonrpc::MakeError(env->id, jsonrpc::kInternalError, "Internal error");
  }
}

nlohmann::json Gateway::Dispatch(const std::string& method, const nlohmann::json& id, const nlohmann::json& params) {
  if (method == "initialize") return HandleInitialize(id, params);
  if (method == "tools/list") return HandleToolsList(id);
  if (method == "tools/call") return HandleToolsCall(id, params);
  if (method == "resources/list") return HandleResourcesList(id);
  if (method == "resources/read") return HandleResourcesRead(id, params);
  if (method == "ui/initialize") return HandleUiInitialize(id);
  LogWarn("gateway", "unknown method: " + method);
  return jsonrpc::MakeError(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

void Gateway::DispatchNotification(const std::string& method, const nlohmann::json&) {
  if (method == "notifications/initialized") {
    LogInfo("gateway", "client confirmed initialization");
  }
}

void Gateway::WarnIfUninitialized(const std::string& method) const {
  if (!initialized_.load()) LogWarn("gateway", method + " before initialize");
}

nlohmann::json Gateway::HandleInitialize(const nlohmann::json& id, const nlohmann::json& params) {
  if (initialized_.load()) LogWarn("gateway", "already initialized");

  std::string protocol_version = "unknown";
  std::string client_name = "unknown";
  if (params.is_object()) {
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string() &&
        !params["protocolVersion"].get<std::string>().empty()) {
      protocol_version = params["protocolVersion"].get<std::string>();
    }
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
      const auto& info = params["clientInfo"];
      if (info.contains("name") && info["name"].is_string() && !info["name"].get<std::string>().empty()) {
        client_name = info["name"].get<std::string>();
      }
    }
  }
  LogInfo("gateway", "client=" + client_name + " protocol=" + protocol_version);

  {
    std::lock_guard<std::mutex> lock(mu_);
    client_name_ = client_name;
  }
  ClientPatch patch;
  patch.protocol_version = protocol_version;
  patch.state = ClientState::kActive;
  state_.UpdateClient(client_name, patch);
  initialized_.store(true);

  nlohmann::json result;
  result["protocolVersion"] = kProtocolVersion;
  result["capabilities"] = {{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}};
  result["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
  return jsonrpc::MakeResult(id, result);
}

nlohmann::json Gateway::HandleToolsList(const nlohmann::json& id) {
  WarnIfUninitialized("tools/list");
  auto snapshot = coordinator_.Current();
  nlohmann::json tools = nlohmann::json::array();
  if (snapshot) {
    for (const auto& t : snapshot->aggregator->GetAggregatedTools()) {
      nlohmann::json entry;
      entry["name"] = t.namespaced_name;
      entry["description"] = t.description;
      entry["inputSchema"] = t.input_schema.is_null() ? nlohmann::json{{"type", "object"}} : t.input_schema;
      tools.push_back(std::move(entry));
    }
  }
  LogInfo("gateway", "returning " + std::to_string(tools.size()) + " tool(s)");
  return jsonrpc::MakeResult(id, {{"tools", tools}});
}

nlohmann::json Gateway::HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
  WarnIfUninitialized("tools/call");
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    LogError("gateway", "tools/call: missing or invalid name");
    return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Missing required parameter: name");
  }

  SanitizedCall call = SanitizeToolCall(params);
  const std::string name = call.params["name"].get<std::string>();
  nlohmann::json arguments = nlohmann::json::object();
  if (call.params.contains("arguments") && !call.params["arguments"].is_null()) {
    arguments = call.params["arguments"];
    if (!arguments.is_object()) {
      return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Invalid parameter: arguments must be an object");
    }
  }

  const CorrelationIds ids = correlator_.Generate(call.bridge_token, id, name, arguments);
  const std::string client = CurrentClient();
  if (!client.empty()) state_.RecordToolCall(client);

  AuditRequest request;
  request.ids = ids;
  request.tool_name = name;
  request.arguments = arguments;
  request.session_token = call.bridge_token;
  audit_->RecordRequest(request);

  const int64_t started = NowMs();
  RouteResult route;
  auto snapshot = coordinator_.Current();
  if (snapshot) {
    route = snapshot->router->RouteToolCall(name, arguments);
  } else {
    route.error = "Unroutable tool name: " + name;
  }

  AuditResult result_record;
  result_record.ids = ids;
  result_record.success = route.success;
  result_record.is_error = route.is_error;
  result_record.error = route.error;
  result_record.duration_ms = NowMs() - started;
  audit_->RecordResult(result_record);

  nlohmann::json response;
  if (!route.success) {
    response = jsonrpc::MakeError(id, jsonrpc::kInternalError, route.error.empty() ? "Unknown error" : route.error);
  } else {
    nlohmann::json result = route.content.is_object() ? route.content : nlohmann::json{{"content", route.content}};
    if (!result.contains("content")) result["content"] = nlohmann::json::array();
    result["isError"] = route.is_error;
    response = jsonrpc::MakeResult(id, result);
  }

  AuditDelivery delivery;
  delivery.ids = ids;
  delivery.delivered = !detached_.load();
  audit_->RecordDelivery(delivery);
  return response;
}

nlohmann::json Gateway::HandleResourcesList(const nlohmann::json& id) {
  WarnIfUninitialized("resources/list");
  nlohmann::json resource;
  resource["uri"] = kTraceViewerUri;
  resource["name"] = "Tool Call Trace Viewer";
  resource["description"] = "Timeline of tool calls routed through the gateway";
  resource["mimeType"] = kUiMimeType;
  return jsonrpc::MakeResult(id, {{"resources", nlohmann::json::array({resource})}});
}

nlohmann::json Gateway::HandleResourcesRead(const nlohmann::json& id, const nlohmann::json& params) {
  WarnIfUninitialized("resources/read");
  if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Missing required parameter: uri");
  }
  const std::string uri = params["uri"].get<std::string>();
  LogInfo("gateway", "resources/read uri=" + TruncateForLog(uri, 200));

  const std::string prefix = std::string("ui://") + kServerName + "/";
  if (uri.size() > kMaxUriLength) return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "URI too long");
  if (uri.compare(0, prefix.size(), prefix) != 0) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Invalid URI scheme or host");
  }
  if (uri.find("..") != std::string::npos) return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Invalid URI path");
  if (uri != kTraceViewerUri) return jsonrpc::MakeError(id, jsonrpc::kInvalidParams, "Resource not found: " + uri);

  nlohmann::json content;
  content["uri"] = uri;
  content["mimeType"] = kUiMimeType;
  content["text"] = kTraceViewerHtml;
  return jsonrpc::MakeResult(id, {{"contents", nlohmann::json::array({content})}});
}

nlohmann::json Gateway::HandleUiInitialize(const nlohmann::json& id) {
  const std::string token = RandomHex128();
  {
    std::lock_guard<std::mutex> lock(mu_);
    session_tokens_.insert(token);
  }
  LogInfo("gateway", "ui/initialize issued session " + UiSessionIdFromToken(token));
  return jsonrpc::MakeResult(id, {{"protocolVersion", kUiProtocolVersion}, {"sessionToken", token}});
}

}  // namespace gateway

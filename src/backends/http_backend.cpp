#include "backends/http_backend.hpp"

#include "json_rpc.hpp"
#include "logging.hpp"

#include <httplib.h>

#include <memory>
#include <sstream>
#include <utility>

namespace gateway {
namespace {

constexpr int kMaxListPages = 64;
constexpr int kUnboundedReadSeconds = 24 * 60 * 60;

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(connect_timeout_seconds);
  return cli;
}

static bool IsEventStream(const std::string& content_type) {
  return content_type.find("text/event-stream") != std::string::npos;
}

}  // namespace

nlohmann::json DecodeEventStreamResponse(const std::string& body, const nlohmann::json& id) {
  std::istringstream in(body);
  std::string line;
  std::string data;
  nlohmann::json found = nlohmann::json(nlohmann::json::value_t::discarded);

  auto flush = [&]() {
    if (data.empty()) return;
    auto msg = nlohmann::json::parse(data, nullptr, false);
    data.clear();
    if (msg.is_discarded() || !msg.is_object()) return;
    if (!msg.contains("id") || msg["id"] != id) return;
    if (msg.contains("result") || msg.contains("error")) found = msg;
  };

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) {
      flush();
      continue;
    }
    if (line.compare(0, 5, "data:") != 0) continue;
    std::string chunk = line.substr(5);
    if (!chunk.empty() && chunk.front() == ' ') chunk.erase(0, 1);
    if (!data.empty()) data += "\n";
    data += chunk;
  }
  flush();
  return found;
}

HttpBackend::HttpBackend(std::string name, HttpEndpoint endpoint, std::map<std::string, std::string> headers)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), headers_(std::move(headers)) {}

void HttpBackend::SetTimeouts(int connect_seconds, int discovery_read_seconds, int call_read_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (discovery_read_seconds > 0) discovery_read_timeout_seconds_ = discovery_read_seconds;
  if (call_read_seconds >= 0) call_read_timeout_seconds_ = call_read_seconds;
}

std::string HttpBackend::SessionId() const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_id_;
}

bool HttpBackend::Start(std::string* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (started_) return true;
  }
  nlohmann::json params;
  params["protocolVersion"] = "2024-11-05";
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "mcp-gateway"}, {"version", "0.1.0"}};
  auto r = Rpc("initialize", params, discovery_read_timeout_seconds_, err);
  if (!r) return false;
  Notify("notifications/initialized");
  std::lock_guard<std::mutex> lock(mu_);
  started_ = true;
  return true;
}

void HttpBackend::Stop() {
  std::lock_guard<std::mutex> lock(mu_);
  started_ = false;
  session_id_.clear();
}

std::optional<std::vector<BackendTool>> HttpBackend::DiscoverTools(std::string* err) {
  std::vector<BackendTool> out;
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Rpc("tools/list", params, discovery_read_timeout_seconds_, err);
    if (!r) return std::nullopt;
    cursor = AppendToolsPage(*r, &out);
    if (cursor.empty()) break;
  }
  return out;
}

std::optional<nlohmann::json> HttpBackend::CallTool(const std::string& name,
                                                    const nlohmann::json& arguments,
                                                    std::string* err) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments;
  const int read_timeout = call_read_timeout_seconds_ > 0 ? call_read_timeout_seconds_ : kUnboundedReadSeconds;
  return Rpc("tools/call", params, read_timeout, err);
}

void HttpBackend::Notify(const std::string& method) {
  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, discovery_read_timeout_seconds_);
  httplib::Headers headers;
  for (const auto& kv : headers_) headers.emplace(kv.first, kv.second);
  headers.emplace("Accept", "application/json, text/event-stream");
  if (auto sid = SessionId(); !sid.empty()) headers.emplace("Mcp-Session-Id", sid);
  const auto path = endpoint_.base_path.empty() ? std::string("/") : endpoint_.base_path;
  auto res = cli->Post(path, headers, jsonrpc::MakeNotification(method, nullptr).dump(), "application/json");
  if (!res) LogWarn("http-backend", "connector=" + name_ + " notify failed method=" + method);
}

std::optional<nlohmann::json> HttpBackend::Rpc(const std::string& method,
                                               const nlohmann::json& params,
                                               int read_timeout_seconds,
                                               std::string* err) {
  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds);
  httplib::Headers headers;
  for (const auto& kv : headers_) headers.emplace(kv.first, kv.second);
  headers.emplace("Accept", "application/json, text/event-stream");
  if (auto sid = SessionId(); !sid.empty()) headers.emplace("Mcp-Session-Id", sid);

  const nlohmann::json id = next_id_++;
  const auto req = jsonrpc::MakeRequest(id, method, params);
  const auto path = endpoint_.base_path.empty() ? std::string("/") : endpoint_.base_path;

  auto res = cli->Post(path, headers, req.dump(), "application/json");
  if (!res) {
    if (err) *err = "mcp: failed to connect to " + endpoint_.host + ":" + std::to_string(endpoint_.port);
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "mcp: http " + std::to_string(res->status);
    return std::nullopt;
  }

  if (res->has_header("Mcp-Session-Id")) {
    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = res->get_header_value("Mcp-Session-Id");
  }

  nlohmann::json resp;
  if (IsEventStream(res->get_header_value("Content-Type"))) {
    resp = DecodeEventStreamResponse(res->body, id);
    if (resp.is_discarded()) {
      if (err) *err = "mcp: no response in event stream";
      return std::nullopt;
    }
  } else {
    resp = nlohmann::json::parse(res->body, nullptr, false);
    if (resp.is_discarded()) {
      if (err) *err = "mcp: invalid json response";
      return std::nullopt;
    }
  }

  std::string rpc_err;
  auto result = jsonrpc::ExtractResult(resp, &rpc_err);
  if (!result) {
    if (err) *err = "mcp: " + rpc_err;
    return std::nullopt;
  }
  return result;
}

}  // namespace gateway

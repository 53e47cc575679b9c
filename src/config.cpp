#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace gateway {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::optional<long> TryParseLong(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return std::nullopt;
  return n;
}

static std::map<std::string, std::string> ParseStringMap(const nlohmann::json& j, const std::string& where) {
  std::map<std::string, std::string> out;
  if (j.is_null()) return out;
  if (!j.is_object()) throw ConfigError(where + " must be an object");
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_string()) throw ConfigError(where + "." + it.key() + " must be a string");
    out[it.key()] = it.value().get<std::string>();
  }
  return out;
}

static ConnectorConfig ParseConnector(const nlohmann::json& c, size_t index) {
  const std::string where = "connectors[" + std::to_string(index) + "]";
  if (!c.is_object()) throw ConfigError(where + " must be an object");

  ConnectorConfig out;
  if (!c.contains("id") || !c["id"].is_string() || c["id"].get<std::string>().empty()) {
    throw ConfigError(where + ".id must be a non-empty string");
  }
  out.id = c["id"].get<std::string>();
  if (out.id.find("__") != std::string::npos) {
    throw ConfigError("connector id must not contain '__': " + out.id);
  }
  // "a_" + "__" + "b" would read back as "a" + "__" + "_b".
  if (out.id.back() == '_') {
    throw ConfigError("connector id must not end with '_': " + out.id);
  }
  if (c.contains("enabled")) {
    if (!c["enabled"].is_boolean()) throw ConfigError(where + ".enabled must be a boolean");
    out.enabled = c["enabled"].get<bool>();
  }

  if (!c.contains("transport") || !c["transport"].is_object()) {
    throw ConfigError(where + ".transport must be an object");
  }
  const auto& t = c["transport"];
  const std::string type = t.value("type", std::string());
  if (type == "stdio") {
    out.kind = TransportKind::kStdio;
    if (!t.contains("command") || !t["command"].is_string() || t["command"].get<std::string>().empty()) {
      throw ConfigError(where + ".transport.command is required for stdio");
    }
    out.stdio.command = t["command"].get<std::string>();
    if (t.contains("args")) {
      if (!t["args"].is_array()) throw ConfigError(where + ".transport.args must be an array");
      for (const auto& a : t["args"]) {
        if (!a.is_string()) throw ConfigError(where + ".transport.args must contain strings");
        out.stdio.args.push_back(a.get<std::string>());
      }
    }
    if (t.contains("env")) out.stdio.env = ParseStringMap(t["env"], where + ".transport.env");
    if (t.contains("cwd") && t["cwd"].is_string()) out.stdio.cwd = t["cwd"].get<std::string>();
  } else if (type == "rpc-http" || type == "rpc-sse") {
    out.kind = type == "rpc-http" ? TransportKind::kHttp : TransportKind::kSse;
    if (!t.contains("url") || !t["url"].is_string()) {
      throw ConfigError(where + ".transport.url is required for " + type);
    }
    out.http.url = t["url"].get<std::string>();
    std::string err;
    if (!ParseHttpEndpoint(out.http.url, &err)) throw ConfigError(where + ".transport.url: " + err);
    if (t.contains("headers")) out.http.headers = ParseStringMap(t["headers"], where + ".transport.headers");
  } else {
    throw ConfigError(where + ".transport.type is unknown: " + (type.empty() ? "<missing>" : type));
  }
  return out;
}

}  // namespace

const char* TransportKindName(TransportKind kind) {
  switch (kind) {
    case TransportKind::kStdio:
      return "stdio";
    case TransportKind::kHttp:
      return "rpc-http";
    case TransportKind::kSse:
      return "rpc-sse";
  }
  return "unknown";
}

std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url, std::string* err) {
  HttpEndpoint ep;
  std::string s = url;
  int default_port = 80;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    default_port = 443;
    s = s.substr(8);
  } else {
    if (err) *err = "url must start with http:// or https://";
    return std::nullopt;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  ep.port = 0;
  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    auto port = TryParseLong(s.substr(colon_pos + 1));
    if (!port || *port <= 0 || *port > 65535) {
      if (err) *err = "invalid port in url";
      return std::nullopt;
    }
    ep.port = static_cast<int>(*port);
  } else {
    ep.host = s;
  }
  if (ep.host.empty()) {
    if (err) *err = "url has no host";
    return std::nullopt;
  }
  if (ep.port == 0) ep.port = default_port;
  return ep;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto dir = GetEnvStr("MCP_GATEWAY_CONFIG_DIR"); !dir.empty()) {
    cfg.config_dir = dir;
  } else if (auto home = GetEnvStr("HOME"); !home.empty()) {
    cfg.config_dir = home + "/.mcp-gateway";
  } else {
    cfg.config_dir = ".mcp-gateway";
  }
  if (auto file = GetEnvStr("MCP_GATEWAY_CONFIG_FILE"); !file.empty()) {
    cfg.config_file = file;
  } else {
    cfg.config_file = cfg.config_dir + "/config.json";
  }

  if (auto v = GetEnvStr("MCP_GATEWAY_VERBOSE"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.verbose = b;
  }
  if (auto v = TryParseLong(GetEnvStr("MCP_GATEWAY_MAX_FRAME_BYTES")); v && *v > 0) {
    cfg.max_frame_bytes = static_cast<size_t>(*v);
  }
  if (auto v = TryParseLong(GetEnvStr("MCP_GATEWAY_IPC_TIMEOUT_MS")); v && *v > 0) {
    cfg.ipc_timeout_ms = static_cast<int>(*v);
  }
  if (auto v = TryParseLong(GetEnvStr("MCP_GATEWAY_HEARTBEAT_MS")); v && *v > 0) {
    cfg.heartbeat_interval_ms = static_cast<int>(*v);
  }
  if (auto v = TryParseLong(GetEnvStr("MCP_GATEWAY_DISCOVERY_TIMEOUT_S")); v && *v > 0) {
    cfg.discovery_timeout_seconds = static_cast<int>(*v);
  }
  if (auto v = TryParseLong(GetEnvStr("MCP_GATEWAY_LOG_BUFFER_LINES")); v && *v > 0) {
    cfg.log_buffer_lines = static_cast<size_t>(*v);
  }
  if (auto v = GetEnvStr("MCP_GATEWAY_PERSIST_STATE"); !v.empty()) {
    bool b = true;
    if (TryParseBool(v, &b)) cfg.persist_state = b;
  }

  return cfg;
}

std::vector<ConnectorConfig> ParseConnectors(const nlohmann::json& doc) {
  if (!doc.is_object()) throw ConfigError("config must be a JSON object");
  if (doc.contains("version") && doc["version"] != 1) throw ConfigError("unsupported config version");

  std::vector<ConnectorConfig> out;
  if (!doc.contains("connectors")) return out;
  if (!doc["connectors"].is_array()) throw ConfigError("connectors must be an array");

  std::set<std::string> seen;
  size_t index = 0;
  for (const auto& c : doc["connectors"]) {
    auto connector = ParseConnector(c, index++);
    if (!seen.insert(connector.id).second) throw ConfigError("duplicate connector id: " + connector.id);
    out.push_back(std::move(connector));
  }
  return out;
}

std::vector<ConnectorConfig> LoadConnectorsFromFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ConfigError("cannot open config file: " + path);
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) throw ConfigError("invalid JSON in config file: " + path);
  return ParseConnectors(doc);
}

std::vector<ConnectorConfig> EnabledConnectors(const std::vector<ConnectorConfig>& all) {
  std::vector<ConnectorConfig> out;
  for (const auto& c : all) {
    if (c.enabled) out.push_back(c);
  }
  return out;
}

nlohmann::json ConnectorToJson(const ConnectorConfig& c) {
  nlohmann::json t;
  t["type"] = TransportKindName(c.kind);
  if (c.kind == TransportKind::kStdio) {
    t["command"] = c.stdio.command;
    t["args"] = c.stdio.args;
    t["env"] = c.stdio.env;
    if (!c.stdio.cwd.empty()) t["cwd"] = c.stdio.cwd;
  } else {
    t["url"] = c.http.url;
    t["headers"] = c.http.headers;
  }
  return {{"id", c.id}, {"enabled", c.enabled}, {"transport", t}};
}

bool SameConnector(const ConnectorConfig& a, const ConnectorConfig& b) {
  return ConnectorToJson(a) == ConnectorToJson(b);
}

}  // namespace gateway

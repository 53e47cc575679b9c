#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gateway {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

enum class TransportKind { kStdio, kHttp, kSse };

struct StdioTransportConfig {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string cwd;
};

struct HttpTransportConfig {
  std::string url;
  std::map<std::string, std::string> headers;
};

// One configured downstream tool provider. Replaced wholesale on reload.
struct ConnectorConfig {
  std::string id;
  bool enabled = true;
  TransportKind kind = TransportKind::kStdio;
  StdioTransportConfig stdio;
  HttpTransportConfig http;
};

struct GatewayConfig {
  std::string config_dir;
  std::string config_file;
  bool verbose = false;
  size_t max_frame_bytes = 1024 * 1024;
  int ipc_timeout_ms = 5000;
  int heartbeat_interval_ms = 5000;
  int discovery_timeout_seconds = 30;
  size_t log_buffer_lines = 1000;
  bool persist_state = true;
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

GatewayConfig LoadConfigFromEnv();

// Parses and validates the connector document. Throws ConfigError.
std::vector<ConnectorConfig> ParseConnectors(const nlohmann::json& doc);
std::vector<ConnectorConfig> LoadConnectorsFromFile(const std::string& path);
std::vector<ConnectorConfig> EnabledConnectors(const std::vector<ConnectorConfig>& all);

nlohmann::json ConnectorToJson(const ConnectorConfig& c);
bool SameConnector(const ConnectorConfig& a, const ConnectorConfig& b);

const char* TransportKindName(TransportKind kind);
std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url, std::string* err);

}  // namespace gateway

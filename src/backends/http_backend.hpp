#pragma once

#include "backends/backend.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

// MCP over HTTP POST (rpc-http), optionally answered as an event stream
// (rpc-sse). One short-lived httplib client per request.
class HttpBackend : public IBackend {
 public:
  HttpBackend(std::string name, HttpEndpoint endpoint, std::map<std::string, std::string> headers);

  std::string Name() const override { return name_; }

  bool Start(std::string* err) override;
  void Stop() override;

  std::optional<std::vector<BackendTool>> DiscoverTools(std::string* err) override;
  std::optional<nlohmann::json> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         std::string* err) override;

  // call_read_seconds applies to tools/call only; 0 leaves it effectively
  // unbounded.
  void SetTimeouts(int connect_seconds, int discovery_read_seconds, int call_read_seconds);

  std::string SessionId() const;

 private:
  std::optional<nlohmann::json> Rpc(const std::string& method,
                                    const nlohmann::json& params,
                                    int read_timeout_seconds,
                                    std::string* err);
  void Notify(const std::string& method);

  std::string name_;
  HttpEndpoint endpoint_;
  std::map<std::string, std::string> headers_;
  std::atomic<int64_t> next_id_{1};
  int connect_timeout_seconds_ = 5;
  int discovery_read_timeout_seconds_ = 30;
  int call_read_timeout_seconds_ = 0;

  mutable std::mutex mu_;
  bool started_ = false;
  std::string session_id_;
};

// Picks the JSON-RPC response with the given id out of a text/event-stream
// body. Returns a discarded json value when none is found.
nlohmann::json DecodeEventStreamResponse(const std::string& body, const nlohmann::json& id);

}  // namespace gateway

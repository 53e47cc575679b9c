#include "backends/factory.hpp"

#include "backends/http_backend.hpp"
#include "backends/stdio_backend.hpp"

#include <utility>

namespace gateway {
namespace {

// Stands in for a connector whose transport could not be constructed.
class BrokenBackend : public IBackend {
 public:
  BrokenBackend(std::string name, std::string error) : name_(std::move(name)), error_(std::move(error)) {}

  std::string Name() const override { return name_; }
  bool Start(std::string* err) override {
    if (err) *err = error_;
    return false;
  }
  std::optional<std::vector<BackendTool>> DiscoverTools(std::string* err) override {
    if (err) *err = error_;
    return std::nullopt;
  }
  std::optional<nlohmann::json> CallTool(const std::string&, const nlohmann::json&, std::string* err) override {
    if (err) *err = error_;
    return std::nullopt;
  }

 private:
  std::string name_;
  std::string error_;
};

}  // namespace

std::unique_ptr<IBackend> MakeBackend(const ConnectorConfig& connector, const BackendOptions& options, std::string* err) {
  switch (connector.kind) {
    case TransportKind::kStdio: {
      auto b = std::make_unique<StdioBackend>(connector.id, connector.stdio);
      b->SetDiscoveryTimeout(options.discovery_timeout_seconds);
      return b;
    }
    case TransportKind::kHttp:
    case TransportKind::kSse: {
      auto ep = ParseHttpEndpoint(connector.http.url, err);
      if (!ep) return nullptr;
      auto b = std::make_unique<HttpBackend>(connector.id, *ep, connector.http.headers);
      b->SetTimeouts(options.discovery_timeout_seconds, options.discovery_timeout_seconds, 0);
      return b;
    }
  }
  if (err) *err = "unsupported transport";
  return nullptr;
}

BackendFactory DefaultBackendFactory(BackendOptions options) {
  return [options](const ConnectorConfig& connector) -> std::unique_ptr<IBackend> {
    std::string err;
    auto b = MakeBackend(connector, options, &err);
    if (!b) return std::make_unique<BrokenBackend>(connector.id, err);
    return b;
  };
}

}  // namespace gateway

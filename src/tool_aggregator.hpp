#pragma once

#include "backends/backend.hpp"
#include "backends/factory.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

inline constexpr const char* kNamespaceSeparator = "__";

struct AggregatedTool {
  std::string connector_id;
  std::string name;
  std::string namespaced_name;
  std::string description;
  nlohmann::json input_schema;
};

struct ConnectorSummary {
  std::string id;
  size_t tool_count = 0;
  bool healthy = false;
  std::string error;
};

nlohmann::json SummaryToJson(const ConnectorSummary& s);

// Merges the catalogs of a fixed set of connectors into one namespace.
//
// The connector list is immutable for the aggregator's lifetime; a reload
// builds a new aggregator. The catalog is loaded at most once per cache
// generation and concurrent callers share the same load.
class ToolAggregator {
 public:
  ToolAggregator(std::vector<ConnectorConfig> connectors, BackendFactory factory);
  ~ToolAggregator();

  ToolAggregator(const ToolAggregator&) = delete;
  ToolAggregator& operator=(const ToolAggregator&) = delete;

  // Starts every backend and queries its catalog concurrently. Never throws;
  // failures show up in Summaries().
  void Preload();

  std::vector<AggregatedTool> GetAggregatedTools();
  // Looks a namespaced name up in the cached catalog, loading it first if
  // needed. Tools of a connector whose discovery failed are never found.
  std::optional<AggregatedTool> FindTool(const std::string& namespaced_name);
  void InvalidateCache();

  // Per-connector outcome of the last load; connectors not yet loaded are
  // reported unhealthy with error "pending".
  std::vector<ConnectorSummary> Summaries() const;

  const std::vector<ConnectorConfig>& Connectors() const { return connectors_; }
  const ConnectorConfig* FindConnector(const std::string& id) const;
  IBackend* Backend(const std::string& id) const;

  static std::string Namespace(const std::string& connector_id, const std::string& tool_name);
  static std::optional<std::pair<std::string, std::string>> ParseNamespace(const std::string& namespaced);

 private:
  struct ConnectorOutcome {
    std::string id;
    std::vector<BackendTool> tools;
    bool healthy = false;
    std::string error;
  };
  struct Catalog {
    std::vector<ConnectorOutcome> outcomes;
    std::vector<AggregatedTool> tools;
  };

  std::shared_future<Catalog> EnsureLoad();
  Catalog LoadAll();
  ConnectorOutcome LoadOne(const ConnectorConfig& connector);

  std::vector<ConnectorConfig> connectors_;
  std::map<std::string, std::unique_ptr<IBackend>> backends_;

  mutable std::mutex mu_;
  std::shared_future<Catalog> load_;
};

}  // namespace gateway

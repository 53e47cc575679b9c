#pragma once

#include "backends/factory.hpp"
#include "config.hpp"
#include "ipc/ipc_protocol.hpp"
#include "request_router.hpp"
#include "runtime_state.hpp"
#include "tool_aggregator.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gateway {

// One immutable generation of the routing layer. In-flight calls keep the
// generation they started on alive until they finish.
struct RoutingSnapshot {
  std::vector<ConnectorConfig> connectors;
  std::unique_ptr<ToolAggregator> aggregator;
  std::unique_ptr<RequestRouter> router;
};

std::shared_ptr<const RoutingSnapshot> MakeRoutingSnapshot(std::vector<ConnectorConfig> connectors,
                                                           const BackendFactory& factory);

struct ConnectorDiff {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<std::string> modified;

  bool Empty() const { return added.empty() && removed.empty() && modified.empty(); }
  std::vector<std::string> Union() const;
};

ConnectorDiff DiffConnectors(const std::vector<ConnectorConfig>& current, const std::vector<ConnectorConfig>& next);

// Returns the full connector list; throws ConfigError on invalid input.
using ConnectorLoader = std::function<std::vector<ConnectorConfig>()>;

class ReloadCoordinator {
 public:
  ReloadCoordinator(ConnectorLoader loader, BackendFactory factory, RuntimeStateManager* state = nullptr);

  // Loads, preloads and publishes the first generation. Throws what the
  // loader throws.
  void LoadInitial();

  std::shared_ptr<const RoutingSnapshot> Current() const;
  void Publish(std::shared_ptr<const RoutingSnapshot> snapshot);

  ReloadResult Reload();

 private:
  ConnectorLoader loader_;
  BackendFactory factory_;
  RuntimeStateManager* state_;

  std::mutex reload_mu_;
  std::shared_ptr<const RoutingSnapshot> current_;
};

}  // namespace gateway

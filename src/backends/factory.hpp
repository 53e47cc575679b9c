#pragma once

#include "backends/backend.hpp"
#include "config.hpp"

#include <functional>
#include <memory>

namespace gateway {

struct BackendOptions {
  int discovery_timeout_seconds = 30;
};

using BackendFactory = std::function<std::unique_ptr<IBackend>(const ConnectorConfig&)>;

// Builds the transport matching connector.kind. Returns nullptr and sets
// *err when the connector cannot be turned into a backend.
std::unique_ptr<IBackend> MakeBackend(const ConnectorConfig& connector, const BackendOptions& options, std::string* err);

// Factory used in production wiring; construction errors are surfaced later
// as a failed Start.
BackendFactory DefaultBackendFactory(BackendOptions options);

}  // namespace gateway

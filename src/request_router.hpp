#pragma once

#include "tool_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace gateway {

struct RouteResult {
  bool success = false;
  nlohmann::json content;
  bool is_error = false;
  std::string error;
};

// Sends a namespaced tool call to the backend that owns it.
class RequestRouter {
 public:
  explicit RequestRouter(ToolAggregator* aggregator) : aggregator_(aggregator) {}

  RouteResult RouteToolCall(const std::string& namespaced_name, const nlohmann::json& arguments) const;

 private:
  ToolAggregator* aggregator_;
};

}  // namespace gateway

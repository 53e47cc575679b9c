#include "request_router.hpp"

#include "logging.hpp"

#include <exception>

namespace gateway {
namespace {

static void LogMcpCall(const std::string& exposed_name, const std::string& remote_name, const nlohmann::json& arguments) {
  LogInfo("mcp-call", "exposed=" + exposed_name + " remote=" + remote_name +
                          " arguments=" + TruncateForLog(SanitizeJsonForLog(arguments), 2000));
}

static void LogMcpResult(const std::string& exposed_name,
                         const std::string& remote_name,
                         bool ok,
                         const std::string& error,
                         const nlohmann::json& result) {
  LogInfo("mcp-result", "exposed=" + exposed_name + " remote=" + remote_name + " ok=" + (ok ? "1" : "0") +
                            " error=" + (error.empty() ? "-" : error) +
                            " result=" + TruncateForLog(SanitizeJsonForLog(result), 2000));
}

}  // namespace

RouteResult RequestRouter::RouteToolCall(const std::string& namespaced_name, const nlohmann::json& arguments) const {
  RouteResult r;
  auto parsed = ToolAggregator::ParseNamespace(namespaced_name);
  const ConnectorConfig* connector = parsed && aggregator_ ? aggregator_->FindConnector(parsed->first) : nullptr;
  if (!connector) {
    r.error = "Unroutable tool name: " + namespaced_name;
    LogWarn("router", r.error);
    return r;
  }
  if (!connector->enabled) {
    r.error = "Connector is disabled: " + connector->id;
    LogWarn("router", r.error);
    return r;
  }
  IBackend* backend = aggregator_->Backend(connector->id);
  if (!backend) {
    r.error = "No backend for connector: " + connector->id;
    LogWarn("router", r.error);
    return r;
  }
  // Only names from the cached catalog are routable; a connector whose
  // discovery failed stays unroutable until the next reload.
  if (!aggregator_->FindTool(namespaced_name)) {
    r.error = "Unroutable tool name: " + namespaced_name;
    LogWarn("router", r.error);
    return r;
  }

  const std::string& remote_name = parsed->second;
  LogMcpCall(namespaced_name, remote_name, arguments);
  try {
    std::string err;
    if (!backend->Start(&err)) {
      r.error = err.empty() ? "backend start failed" : err;
    } else if (auto result = backend->CallTool(remote_name, arguments, &err)) {
      r.success = true;
      r.content = std::move(*result);
      if (r.content.is_object() && r.content.contains("isError") && r.content["isError"].is_boolean()) {
        r.is_error = r.content["isError"].get<bool>();
      }
    } else {
      r.error = err.empty() ? "mcp: call failed" : err;
    }
  } catch (const std::exception& e) {
    r.success = false;
    r.error = e.what();
  }
  LogMcpResult(namespaced_name, remote_name, r.success && !r.is_error, r.error, r.content);
  return r;
}

}  // namespace gateway

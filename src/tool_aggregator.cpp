#include "tool_aggregator.hpp"

#include "logging.hpp"

#include <chrono>
#include <exception>
#include <set>

namespace gateway {

nlohmann::json SummaryToJson(const ConnectorSummary& s) {
  nlohmann::json j;
  j["id"] = s.id;
  j["toolCount"] = s.tool_count;
  j["healthy"] = s.healthy;
  if (!s.error.empty()) j["error"] = s.error;
  return j;
}

ToolAggregator::ToolAggregator(std::vector<ConnectorConfig> connectors, BackendFactory factory)
    : connectors_(std::move(connectors)) {
  for (const auto& c : connectors_) {
    if (!c.enabled || !factory) continue;
    auto backend = factory(c);
    if (backend) backends_[c.id] = std::move(backend);
  }
}

ToolAggregator::~ToolAggregator() {
  std::shared_future<Catalog> pending;
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending = load_;
  }
  if (pending.valid()) pending.wait();
  for (auto& kv : backends_) kv.second->Stop();
}

std::string ToolAggregator::Namespace(const std::string& connector_id, const std::string& tool_name) {
  return connector_id + kNamespaceSeparator + tool_name;
}

std::optional<std::pair<std::string, std::string>> ToolAggregator::ParseNamespace(const std::string& namespaced) {
  auto pos = namespaced.find(kNamespaceSeparator);
  if (pos == std::string::npos || pos == 0) return std::nullopt;
  std::string tool = namespaced.substr(pos + 2);
  if (tool.empty()) return std::nullopt;
  return std::make_pair(namespaced.substr(0, pos), std::move(tool));
}

const ConnectorConfig* ToolAggregator::FindConnector(const std::string& id) const {
  for (const auto& c : connectors_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

IBackend* ToolAggregator::Backend(const std::string& id) const {
  auto it = backends_.find(id);
  if (it == backends_.end()) return nullptr;
  return it->second.get();
}

void ToolAggregator::Preload() {
  EnsureLoad().wait();
}

std::vector<AggregatedTool> ToolAggregator::GetAggregatedTools() {
  return EnsureLoad().get().tools;
}

std::optional<AggregatedTool> ToolAggregator::FindTool(const std::string& namespaced_name) {
  auto load = EnsureLoad();
  for (const auto& t : load.get().tools) {
    if (t.namespaced_name == namespaced_name) return t;
  }
  return std::nullopt;
}

void ToolAggregator::InvalidateCache() {
  std::shared_future<Catalog> dropped;
  {
    std::lock_guard<std::mutex> lock(mu_);
    dropped = std::move(load_);
    load_ = std::shared_future<Catalog>();
  }
  // A load still in flight finishes before its state is released.
  if (dropped.valid()) dropped.wait();
}

std::vector<ConnectorSummary> ToolAggregator::Summaries() const {
  std::shared_future<Catalog> load;
  {
    std::lock_guard<std::mutex> lock(mu_);
    load = load_;
  }
  std::vector<ConnectorSummary> out;
  const bool ready = load.valid() && load.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  for (const auto& c : connectors_) {
    if (!c.enabled) continue;
    ConnectorSummary s;
    s.id = c.id;
    if (!ready) {
      s.error = "pending";
      out.push_back(std::move(s));
      continue;
    }
    for (const auto& o : load.get().outcomes) {
      if (o.id != c.id) continue;
      s.tool_count = o.tools.size();
      s.healthy = o.healthy;
      s.error = o.error;
    }
    out.push_back(std::move(s));
  }
  return out;
}

std::shared_future<ToolAggregator::Catalog> ToolAggregator::EnsureLoad() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!load_.valid()) {
    load_ = std::async(std::launch::async, [this]() { return LoadAll(); }).share();
  }
  return load_;
}

ToolAggregator::Catalog ToolAggregator::LoadAll() {
  std::vector<std::future<ConnectorOutcome>> tasks;
  for (const auto& c : connectors_) {
    if (!c.enabled) continue;
    tasks.push_back(std::async(std::launch::async, [this, &c]() { return LoadOne(c); }));
  }

  Catalog catalog;
  for (auto& t : tasks) catalog.outcomes.push_back(t.get());

  for (const auto& o : catalog.outcomes) {
    std::set<std::string> seen;
    for (const auto& tool : o.tools) {
      if (!seen.insert(tool.name).second) {
        LogWarn("aggregator", "connector=" + o.id + " duplicate tool dropped: " + tool.name);
        continue;
      }
      AggregatedTool a;
      a.connector_id = o.id;
      a.name = tool.name;
      a.namespaced_name = Namespace(o.id, tool.name);
      a.description = tool.description;
      a.input_schema = tool.input_schema;
      catalog.tools.push_back(std::move(a));
    }
  }
  LogInfo("aggregator", "loaded connectors=" + std::to_string(catalog.outcomes.size()) +
                            " tools=" + std::to_string(catalog.tools.size()));
  return catalog;
}

ToolAggregator::ConnectorOutcome ToolAggregator::LoadOne(const ConnectorConfig& connector) {
  ConnectorOutcome out;
  out.id = connector.id;
  IBackend* backend = Backend(connector.id);
  if (!backend) {
    out.error = "no backend for transport " + std::string(TransportKindName(connector.kind));
    LogWarn("aggregator", "connector=" + connector.id + " error=" + out.error);
    return out;
  }
  try {
    std::string err;
    if (!backend->Start(&err)) {
      out.error = err.empty() ? "start failed" : err;
    } else if (auto tools = backend->DiscoverTools(&err)) {
      out.tools = std::move(*tools);
      out.healthy = true;
    } else {
      out.error = err.empty() ? "tools/list failed" : err;
    }
  } catch (const std::exception& e) {
    out.error = e.what();
  }
  if (!out.healthy) {
    LogWarn("aggregator", "connector=" + connector.id + " error=" + out.error);
  } else {
    LogInfo("aggregator", "connector=" + connector.id + " tools=" + std::to_string(out.tools.size()));
  }
  return out;
}

}  // namespace gateway

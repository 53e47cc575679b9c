#include "reload_coordinator.hpp"

#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <set>
#include <utility>

namespace gateway {
namespace {

static std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out.empty() ? "-" : out;
}

}  // namespace

std::shared_ptr<const RoutingSnapshot> MakeRoutingSnapshot(std::vector<ConnectorConfig> connectors,
                                                           const BackendFactory& factory) {
  auto snapshot = std::make_shared<RoutingSnapshot>();
  snapshot->connectors = std::move(connectors);
  snapshot->aggregator = std::make_unique<ToolAggregator>(snapshot->connectors, factory);
  snapshot->router = std::make_unique<RequestRouter>(snapshot->aggregator.get());
  return snapshot;
}

std::vector<std::string> ConnectorDiff::Union() const {
  std::set<std::string> all(added.begin(), added.end());
  all.insert(removed.begin(), removed.end());
  all.insert(modified.begin(), modified.end());
  return std::vector<std::string>(all.begin(), all.end());
}

ConnectorDiff DiffConnectors(const std::vector<ConnectorConfig>& current, const std::vector<ConnectorConfig>& next) {
  std::map<std::string, const ConnectorConfig*> old_by_id;
  for (const auto& c : current) old_by_id[c.id] = &c;
  std::map<std::string, const ConnectorConfig*> new_by_id;
  for (const auto& c : next) new_by_id[c.id] = &c;

  ConnectorDiff diff;
  for (const auto& kv : new_by_id) {
    auto it = old_by_id.find(kv.first);
    if (it == old_by_id.end()) {
      diff.added.push_back(kv.first);
    } else if (!SameConnector(*it->second, *kv.second)) {
      diff.modified.push_back(kv.first);
    }
  }
  for (const auto& kv : old_by_id) {
    if (!new_by_id.count(kv.first)) diff.removed.push_back(kv.first);
  }
  return diff;
}

ReloadCoordinator::ReloadCoordinator(ConnectorLoader loader, BackendFactory factory, RuntimeStateManager* state)
    : loader_(std::move(loader)), factory_(std::move(factory)), state_(state) {}

void ReloadCoordinator::LoadInitial() {
  std::lock_guard<std::mutex> lock(reload_mu_);
  auto connectors = EnabledConnectors(loader_ ? loader_() : std::vector<ConnectorConfig>());
  auto snapshot = MakeRoutingSnapshot(std::move(connectors), factory_);
  snapshot->aggregator->Preload();
  Publish(snapshot);
}

std::shared_ptr<const RoutingSnapshot> ReloadCoordinator::Current() const {
  return std::atomic_load(&current_);
}

void ReloadCoordinator::Publish(std::shared_ptr<const RoutingSnapshot> snapshot) {
  std::atomic_store(&current_, std::move(snapshot));
}

ReloadResult ReloadCoordinator::Reload() {
  std::lock_guard<std::mutex> lock(reload_mu_);
  ReloadResult result;
  try {
    auto next = EnabledConnectors(loader_ ? loader_() : std::vector<ConnectorConfig>());
    auto current = Current();
    const std::vector<ConnectorConfig> empty;
    auto diff = DiffConnectors(current ? current->connectors : empty, next);
    if (diff.Empty()) {
      result.success = true;
      result.message = "No changes detected";
      LogInfo("reload", "no changes detected");
      return result;
    }

    auto snapshot = MakeRoutingSnapshot(std::move(next), factory_);
    snapshot->aggregator->Preload();
    const auto summaries = snapshot->aggregator->Summaries();
    Publish(snapshot);
    if (state_) state_->SetConnectors(summaries);

    std::set<std::string> changed(diff.added.begin(), diff.added.end());
    changed.insert(diff.modified.begin(), diff.modified.end());
    for (const auto& s : summaries) {
      if (!s.healthy && changed.count(s.id)) result.failed_connectors.push_back(s.id);
    }
    result.success = true;
    result.reloaded_connectors = diff.Union();
    result.message = "added=" + JoinIds(diff.added) + " removed=" + JoinIds(diff.removed) +
                     " modified=" + JoinIds(diff.modified);
    LogInfo("reload", result.message + " failed=" + JoinIds(result.failed_connectors));
  } catch (const std::exception& e) {
    result = ReloadResult();
    result.success = false;
    result.message = e.what();
    LogError("reload", std::string("reload failed: ") + e.what());
  }
  return result;
}

}  // namespace gateway

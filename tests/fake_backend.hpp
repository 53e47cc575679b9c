#pragma once

#include "backends/backend.hpp"
#include "backends/factory.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gateway_test {

// Scripted behaviour for one connector id.
struct FakeScript {
  std::vector<std::string> tools;
  bool fail_start = false;
  bool fail_call = false;
  bool app_error = false;
};

// Counts shared across every backend a factory built.
struct FakeStats {
  std::atomic<int> starts{0};
  std::atomic<int> discovers{0};
  std::atomic<int> calls{0};
  std::mutex mu;
  std::vector<nlohmann::json> call_log;
};

class FakeBackend : public gateway::IBackend {
 public:
  FakeBackend(std::string name, FakeScript script, std::shared_ptr<FakeStats> stats)
      : name_(std::move(name)), script_(std::move(script)), stats_(std::move(stats)) {}

  std::string Name() const override { return name_; }

  bool Start(std::string* err) override {
    stats_->starts++;
    if (script_.fail_start) {
      if (err) *err = "connection refused";
      return false;
    }
    return true;
  }

  std::optional<std::vector<gateway::BackendTool>> DiscoverTools(std::string* err) override {
    stats_->discovers++;
    if (script_.fail_start) {
      if (err) *err = "connection refused";
      return std::nullopt;
    }
    std::vector<gateway::BackendTool> out;
    for (const auto& t : script_.tools) {
      gateway::BackendTool tool;
      tool.name = t;
      tool.description = name_ + " " + t;
      tool.input_schema = {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}};
      out.push_back(tool);
    }
    return out;
  }

  std::optional<nlohmann::json> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         std::string* err) override {
    stats_->calls++;
    {
      std::lock_guard<std::mutex> lock(stats_->mu);
      stats_->call_log.push_back({{"backend", name_}, {"tool", name}, {"arguments", arguments}});
    }
    if (script_.fail_call) {
      if (err) *err = "backend unavailable";
      return std::nullopt;
    }
    nlohmann::json result;
    result["content"] = nlohmann::json::array({{{"type", "text"}, {"text", name_ + ":" + name}}});
    if (script_.app_error) result["isError"] = true;
    return result;
  }

 private:
  std::string name_;
  FakeScript script_;
  std::shared_ptr<FakeStats> stats_;
};

// Builds FakeBackends from a script table keyed by connector id. Unknown ids
// get a backend with no tools.
class FakeBackendFactory {
 public:
  FakeBackendFactory() : stats_(std::make_shared<FakeStats>()) {}

  void Set(const std::string& id, FakeScript script) {
    std::lock_guard<std::mutex> lock(*mu_);
    (*scripts_)[id] = std::move(script);
  }

  gateway::BackendFactory Factory() const {
    auto scripts = scripts_;
    auto mu = mu_;
    auto stats = stats_;
    return [scripts, mu, stats](const gateway::ConnectorConfig& c) -> std::unique_ptr<gateway::IBackend> {
      FakeScript script;
      {
        std::lock_guard<std::mutex> lock(*mu);
        auto it = scripts->find(c.id);
        if (it != scripts->end()) script = it->second;
      }
      return std::make_unique<FakeBackend>(c.id, script, stats);
    };
  }

  FakeStats& Stats() { return *stats_; }

 private:
  std::shared_ptr<std::map<std::string, FakeScript>> scripts_ = std::make_shared<std::map<std::string, FakeScript>>();
  std::shared_ptr<std::mutex> mu_ = std::make_shared<std::mutex>();
  std::shared_ptr<FakeStats> stats_;
};

inline gateway::ConnectorConfig StdioConnector(const std::string& id, const std::string& command = "fake") {
  gateway::ConnectorConfig c;
  c.id = id;
  c.kind = gateway::TransportKind::kStdio;
  c.stdio.command = command;
  return c;
}

}  // namespace gateway_test

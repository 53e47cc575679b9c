#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct BackendTool {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

// One downstream tool provider, whatever its transport.
//
// CallTool returns the backend's `result` object untouched (including
// `isError:true` results); nullopt means the transport itself failed.
class IBackend {
 public:
  virtual ~IBackend() = default;

  virtual std::string Name() const = 0;

  virtual bool Start(std::string* err) = 0;
  virtual void Stop() {}

  virtual std::optional<std::vector<BackendTool>> DiscoverTools(std::string* err) = 0;
  virtual std::optional<nlohmann::json> CallTool(const std::string& name,
                                                 const nlohmann::json& arguments,
                                                 std::string* err) = 0;
};

// Parses one page of a tools/list result into out. Returns the nextCursor
// (empty when there is none).
std::string AppendToolsPage(const nlohmann::json& result, std::vector<BackendTool>* out);

}  // namespace gateway

#include "backends/backend.hpp"

#include <utility>

namespace gateway {

std::string AppendToolsPage(const nlohmann::json& result, std::vector<BackendTool>* out) {
  if (!result.is_object()) return {};
  if (!result.contains("tools") || !result["tools"].is_array()) return {};
  for (const auto& t : result["tools"]) {
    if (!t.is_object()) continue;
    BackendTool info;
    if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
    if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
    if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
    if (t.contains("inputSchema")) info.input_schema = t["inputSchema"];
    if (!info.name.empty() && out) out->push_back(std::move(info));
  }
  if (result.contains("nextCursor") && result["nextCursor"].is_string()) return result["nextCursor"].get<std::string>();
  return {};
}

}  // namespace gateway

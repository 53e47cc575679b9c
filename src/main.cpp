#include "backends/factory.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "ipc/ipc_client.hpp"
#include "ipc/ipc_protocol.hpp"
#include "logging.hpp"
#include "runtime_state.hpp"

#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

namespace {

static void PrintUsage() {
  std::cerr << "usage: mcp_gateway [serve|status|reload|stop]\n"
            << "  serve   run the gateway on stdin/stdout (default)\n"
            << "  status  show the running gateway's state\n"
            << "  reload  re-read the connector configuration\n"
            << "  stop    stop the running gateway\n";
}

static void PrintConfig(const gateway::GatewayConfig& cfg) {
  gateway::LogInfo("config", "config_dir=" + cfg.config_dir + " config_file=" + cfg.config_file);
  gateway::LogInfo("config", "max_frame_bytes=" + std::to_string(cfg.max_frame_bytes) +
                                 " heartbeat_ms=" + std::to_string(cfg.heartbeat_interval_ms) +
                                 " discovery_timeout_s=" + std::to_string(cfg.discovery_timeout_seconds) +
                                 " persist_state=" + (cfg.persist_state ? "true" : "false"));
}

static int Serve(const gateway::GatewayConfig& cfg) {
  PrintConfig(cfg);

  gateway::BackendOptions backend_options;
  backend_options.discovery_timeout_seconds = cfg.discovery_timeout_seconds;
  const std::string config_file = cfg.config_file;
  gateway::Gateway gw(
      cfg, [config_file]() { return gateway::LoadConnectorsFromFile(config_file); },
      gateway::DefaultBackendFactory(backend_options));

  std::string err;
  if (!gw.Start(&err)) {
    std::cerr << "[gateway] startup failed: " << err << "\n";
    return 1;
  }
  gw.OnStopped([]() { gateway::LogInfo("gateway", "stopped"); });
  return gw.Run(STDIN_FILENO, STDOUT_FILENO);
}

static int Status(const gateway::GatewayConfig& cfg) {
  gateway::IpcClient client(gateway::SocketPathForConfigDir(cfg.config_dir), cfg.ipc_timeout_ms);
  std::string err;
  if (auto state = client.Status(&err)) {
    std::cout << nlohmann::json({{"running", true}, {"state", *state}}).dump(2) << "\n";
    return 0;
  }

  // Fall back to the last persisted state when nothing answers.
  auto persisted = gateway::RuntimeStateManager::ReadPersisted(cfg.config_dir + "/gateway-runtime-state.json");
  nlohmann::json out;
  out["running"] = persisted ? gateway::RuntimeStateManager::IsAlive(*persisted) : false;
  out["error"] = err;
  if (persisted) {
    for (auto& kv : (*persisted)["clients"].items()) {
      kv.value()["state"] = gateway::ClientStateName(gateway::RuntimeStateManager::DetermineClientState(kv.value()));
    }
    out["state"] = *persisted;
  }
  std::cout << out.dump(2) << "\n";
  return 1;
}

static int Reload(const gateway::GatewayConfig& cfg) {
  gateway::IpcClient client(gateway::SocketPathForConfigDir(cfg.config_dir), cfg.ipc_timeout_ms);
  std::string err;
  auto result = client.Reload(&err);
  if (!result) {
    std::cout << nlohmann::json({{"success", false}, {"error", err}}).dump(2) << "\n";
    return 1;
  }
  std::cout << gateway::ReloadResultToJson(*result).dump(2) << "\n";
  return result->success ? 0 : 1;
}

static int Stop(const gateway::GatewayConfig& cfg) {
  gateway::IpcClient client(gateway::SocketPathForConfigDir(cfg.config_dir), cfg.ipc_timeout_ms);
  std::string err;
  const bool ok = client.Stop(&err);
  nlohmann::json out = {{"success", ok}};
  if (!ok) out["error"] = err;
  std::cout << out.dump(2) << "\n";
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  auto cfg = gateway::LoadConfigFromEnv();
  gateway::Logger::Instance().SetVerbose(cfg.verbose);

  const char* cmd = argc > 1 ? argv[1] : "serve";
  if (std::strcmp(cmd, "serve") == 0) return Serve(cfg);
  if (std::strcmp(cmd, "status") == 0) return Status(cfg);
  if (std::strcmp(cmd, "reload") == 0) return Reload(cfg);
  if (std::strcmp(cmd, "stop") == 0) return Stop(cfg);
  if (std::strcmp(cmd, "-h") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "help") == 0) {
    PrintUsage();
    return 0;
  }
  std::cerr << "unknown command: " << cmd << "\n";
  PrintUsage();
  return 2;
}

#include "backends/stdio_backend.hpp"

#include "json_rpc.hpp"
#include "logging.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace gateway {
namespace {

constexpr size_t kMaxBackendLineBytes = 64 * 1024 * 1024;
constexpr int kMaxListPages = 64;
constexpr int kStopGraceMs = 500;

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

static void CloseFd(int* fd) {
  if (*fd >= 0) ::close(*fd);
  *fd = -1;
}

static int RemainingMs(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

StdioBackend::StdioBackend(std::string name, StdioTransportConfig config)
    : name_(std::move(name)), config_(std::move(config)), reader_(kMaxBackendLineBytes) {}

StdioBackend::~StdioBackend() {
  Stop();
}

void StdioBackend::SetDiscoveryTimeout(int seconds) {
  if (seconds > 0) discovery_timeout_ms_ = seconds * 1000;
}

pid_t StdioBackend::Pid() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_;
}

bool StdioBackend::Start(std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_) return true;
  if (pid_ < 0 && !SpawnLocked(err)) return false;

  nlohmann::json params;
  params["protocolVersion"] = "2024-11-05";
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "mcp-gateway"}, {"version", "0.1.0"}};
  auto r = RequestLocked("initialize", params, discovery_timeout_ms_, err);
  if (!r) {
    StopLocked();
    return false;
  }
  std::string write_err;
  if (!WriteLineLocked(jsonrpc::MakeNotification("notifications/initialized", nullptr).dump(), &write_err)) {
    if (err) *err = write_err;
    StopLocked();
    return false;
  }
  initialized_ = true;
  LogInfo("stdio-backend", "connector=" + name_ + " started pid=" + std::to_string(pid_));
  return true;
}

void StdioBackend::Stop() {
  std::lock_guard<std::mutex> lock(mu_);
  StopLocked();
}

std::optional<std::vector<BackendTool>> StdioBackend::DiscoverTools(std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    if (err) *err = "backend not started";
    return std::nullopt;
  }
  std::vector<BackendTool> out;
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = RequestLocked("tools/list", params, discovery_timeout_ms_, err);
    if (!r) return std::nullopt;
    cursor = AppendToolsPage(*r, &out);
    if (cursor.empty()) break;
  }
  return out;
}

std::optional<nlohmann::json> StdioBackend::CallTool(const std::string& name,
                                                     const nlohmann::json& arguments,
                                                     std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    if (err) *err = "backend not started";
    return std::nullopt;
  }
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments;
  return RequestLocked("tools/call", params, -1, err);
}

bool StdioBackend::SpawnLocked(std::string* err) {
  IgnoreSigpipeOnce();

  int in_pipe[2]{-1, -1};
  int out_pipe[2]{-1, -1};
  int err_pipe[2]{-1, -1};
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) CloseFd(fd);
    if (err) *err = std::string("pipe() failed: ") + std::strerror(errno);
    return false;
  }

  // argv and envp are built before fork so the child only calls
  // async-signal-safe functions.
  std::vector<std::string> args;
  args.push_back(config_.command);
  for (const auto& a : config_.args) args.push_back(a);
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  for (char** e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    if (eq != std::string::npos && config_.env.count(kv.substr(0, eq))) continue;
    env_strings.push_back(std::move(kv));
  }
  for (const auto& kv : config_.env) env_strings.push_back(kv.first + "=" + kv.second);
  std::vector<char*> envp;
  for (auto& e : env_strings) envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) CloseFd(fd);
    if (err) *err = std::string("fork() failed: ") + std::strerror(errno);
    return false;
  }

  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (!config_.cwd.empty() && ::chdir(config_.cwd.c_str()) != 0) _exit(127);
    ::execvpe(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  reader_.Reset();
  pending_lines_.clear();
  const int stderr_fd = err_pipe[0];
  stderr_thread_ = std::thread([this, stderr_fd]() { ForwardStderr(stderr_fd); });
  return true;
}

void StdioBackend::StopLocked() {
  initialized_ = false;
  CloseFd(&stdin_fd_);
  if (pid_ > 0) {
    // Closing stdin is the polite request; escalate if the child lingers.
    int status = 0;
    bool exited = false;
    for (int waited = 0; waited < kStopGraceMs; waited += 10) {
      if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        exited = true;
        break;
      }
      ::usleep(10 * 1000);
    }
    if (!exited) {
      ::kill(pid_, SIGTERM);
      ::waitpid(pid_, &status, 0);
    }
    LogInfo("stdio-backend", "connector=" + name_ + " stopped pid=" + std::to_string(pid_));
  }
  pid_ = -1;
  CloseFd(&stdout_fd_);
  if (stderr_thread_.joinable()) stderr_thread_.join();
  pending_lines_.clear();
  reader_.Reset();
}

bool StdioBackend::WriteLineLocked(const std::string& line, std::string* err) {
  std::string data = line + "\n";
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (err) *err = "write to backend failed: " + std::string(std::strerror(errno));
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

std::optional<nlohmann::json> StdioBackend::RequestLocked(const std::string& method,
                                                          const nlohmann::json& params,
                                                          int timeout_ms,
                                                          std::string* err) {
  if (stdin_fd_ < 0 || stdout_fd_ < 0) {
    if (err) *err = "backend process is not running";
    return std::nullopt;
  }
  const nlohmann::json id = next_id_++;
  if (!WriteLineLocked(jsonrpc::MakeRequest(id, method, params).dump(), err)) return std::nullopt;

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
  while (true) {
    while (!pending_lines_.empty()) {
      std::string line = std::move(pending_lines_.front());
      pending_lines_.pop_front();
      auto msg = nlohmann::json::parse(line, nullptr, false);
      if (msg.is_discarded() || !msg.is_object()) {
        LogWarn("stdio-backend", "connector=" + name_ + " non-json output: " + TruncateForLog(line, 200));
        continue;
      }
      // Notifications and server-to-client requests are not ours.
      if (!msg.contains("id") || msg["id"] != id || msg.contains("method")) continue;
      std::string rpc_err;
      auto result = jsonrpc::ExtractResult(msg, &rpc_err);
      if (!result) {
        if (err) *err = rpc_err;
        return std::nullopt;
      }
      return result;
    }

    const int wait_ms = timeout_ms < 0 ? -1 : RemainingMs(deadline);
    if (timeout_ms >= 0 && wait_ms == 0) {
      if (err) *err = "timed out waiting for " + method + " response";
      return std::nullopt;
    }
    pollfd pfd{};
    pfd.fd = stdout_fd_;
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, wait_ms);
    if (ret < 0) {
      if (errno == EINTR) continue;
      if (err) *err = std::string("poll() failed: ") + std::strerror(errno);
      return std::nullopt;
    }
    if (ret == 0) continue;

    char chunk[4096];
    ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      if (err) *err = "backend process exited";
      return std::nullopt;
    }
    auto fed = reader_.Feed(chunk, static_cast<size_t>(n));
    if (fed.overflowed) {
      if (err) *err = "backend output line too large";
      return std::nullopt;
    }
    for (auto& l : fed.lines) pending_lines_.push_back(std::move(l));
  }
}

void StdioBackend::ForwardStderr(int fd) {
  FrameReader lines(kMaxBackendLineBytes);
  char chunk[4096];
  while (true) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    for (const auto& line : lines.Feed(chunk, static_cast<size_t>(n)).lines) {
      LogInfo("backend:" + name_, line);
    }
  }
  ::close(fd);
}

}  // namespace gateway

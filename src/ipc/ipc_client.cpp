#include "ipc/ipc_client.hpp"

#include "frame_reader.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

namespace gateway {
namespace {

// Closes the descriptor on every exit path.
class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) ::close(fd_);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  int get() const { return fd_; }

 private:
  int fd_;
};

}  // namespace

IpcClient::IpcClient(std::string socket_path, int timeout_ms)
    : socket_path_(std::move(socket_path)), timeout_ms_(timeout_ms > 0 ? timeout_ms : kDefaultTimeoutMs) {}

std::optional<IpcResponse> IpcClient::Send(IpcCommandType type, std::string* err) {
  bool closed_early = false;
  return SendImpl(type, &closed_early, err);
}

std::optional<IpcResponse> IpcClient::SendImpl(IpcCommandType type, bool* closed_early, std::string* err) {
  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    if (err) *err = "socket path too long: " + socket_path_;
    return std::nullopt;
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  FdGuard sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (sock.get() < 0) {
    if (err) *err = std::string("socket() failed: ") + std::strerror(errno);
    return std::nullopt;
  }
  if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (err) *err = std::string("Connection error: ") + std::strerror(errno);
    return std::nullopt;
  }

  const std::string id = GenerateIpcRequestId();
  const std::string line = MakeIpcRequest(id, type).dump() + "\n";
  size_t off = 0;
  while (off < line.size()) {
    ssize_t n = ::send(sock.get(), line.data() + off, line.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (err) *err = std::string("Connection error: ") + std::strerror(errno);
      return std::nullopt;
    }
    off += static_cast<size_t>(n);
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
  FrameReader reader;
  char buf[4096];
  while (true) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
      if (err) *err = "IPC request timed out";
      return std::nullopt;
    }
    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, static_cast<int>(left));
    if (ret < 0) {
      if (errno == EINTR) continue;
      if (err) *err = std::string("poll() failed: ") + std::strerror(errno);
      return std::nullopt;
    }
    if (ret == 0) continue;

    ssize_t n = ::read(sock.get(), buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      if (closed_early) *closed_early = true;
      if (err) *err = "Connection closed before response";
      return std::nullopt;
    }
    for (const auto& l : reader.Feed(buf, static_cast<size_t>(n)).lines) {
      auto msg = nlohmann::json::parse(l, nullptr, false);
      if (msg.is_discarded() || !msg.is_object()) continue;
      if (msg.value("kind", std::string()) != "response") continue;
      if (!msg.contains("id") || !msg["id"].is_string() || msg["id"].get<std::string>() != id) continue;
      if (!msg.contains("response")) {
        if (err) *err = "Empty response";
        return std::nullopt;
      }
      return IpcResponseFromJson(msg["response"]);
    }
  }
}

std::optional<ReloadResult> IpcClient::Reload(std::string* err) {
  auto r = Send(IpcCommandType::kReload, err);
  if (!r) return std::nullopt;
  if (r->type != "ok") {
    if (err) *err = r->type == "error" ? r->error : "Unexpected response";
    return std::nullopt;
  }
  auto result = ReloadResultFromJson(r->data);
  if (!result) {
    ReloadResult fallback;
    fallback.success = true;
    fallback.message = r->message;
    return fallback;
  }
  return result;
}

bool IpcClient::Stop(std::string* err) {
  bool closed_early = false;
  auto r = SendImpl(IpcCommandType::kStop, &closed_early, err);
  if (!r) {
    if (closed_early && err) err->clear();
    return closed_early;
  }
  if (r->type == "ok") return true;
  if (err) *err = r->type == "error" ? r->error : "Unexpected response";
  return false;
}

std::optional<nlohmann::json> IpcClient::Status(std::string* err) {
  auto r = Send(IpcCommandType::kStatus, err);
  if (!r) return std::nullopt;
  if (r->type != "status") {
    if (err) *err = r->type == "error" ? r->error : "Unexpected response";
    return std::nullopt;
  }
  return r->data;
}

bool IpcClient::IsRunning() {
  std::string err;
  return Status(&err).has_value();
}

}  // namespace gateway

#include "ipc/ipc_server.hpp"

#include "frame_reader.hpp"
#include "logging.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>
#include <vector>

namespace gateway {
namespace {

static IpcResponse ErrorResponse(const std::string& error) {
  IpcResponse r;
  r.type = "error";
  r.error = error;
  return r;
}

}  // namespace

IpcServer::IpcServer(std::string socket_path, IpcHandlers handlers)
    : socket_path_(std::move(socket_path)), handlers_(std::move(handlers)) {}

IpcServer::~IpcServer() {
  Stop();
  std::thread pending;
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending = std::move(stop_thread_);
  }
  if (pending.joinable()) {
    if (pending.get_id() == std::this_thread::get_id()) {
      pending.detach();
    } else {
      pending.join();
    }
  }
}

bool IpcServer::Start(std::string* err) {
  if (running_.load()) return true;

  if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
    if (err) *err = std::string("pipe() failed: ") + std::strerror(errno);
    return false;
  }

  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    if (err) *err = "socket path too long: " + socket_path_;
    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
    wake_pipe_[0] = wake_pipe_[1] = -1;
    return false;
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  // A socket file left behind by a crashed gateway would make bind fail.
  ::unlink(socket_path_.c_str());

  listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  std::string failure;
  if (listen_fd_ < 0) {
    failure = std::string("socket() failed: ") + std::strerror(errno);
  } else if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    failure = std::string("bind() failed: ") + std::strerror(errno);
  } else {
    ::chmod(socket_path_.c_str(), 0600);
    if (::listen(listen_fd_, kMaxConnections) < 0) {
      failure = std::string("listen() failed: ") + std::strerror(errno);
      ::unlink(socket_path_.c_str());
    }
  }
  if (!failure.empty()) {
    if (listen_fd_ >= 0) ::close(listen_fd_);
    listen_fd_ = -1;
    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
    wake_pipe_[0] = wake_pipe_[1] = -1;
    if (err) *err = failure;
    return false;
  }

  std::thread previous_stop;
  {
    std::lock_guard<std::mutex> lock(mu_);
    previous_stop = std::move(stop_thread_);
    stop_scheduled_ = false;
  }
  if (previous_stop.joinable()) previous_stop.join();
  running_.store(true);
  listener_ = std::thread([this]() { ListenLoop(); });
  LogInfo("ipc", "listening on " + socket_path_);
  return true;
}

void IpcServer::Stop() {
  const bool was_running = running_.exchange(false);
  if (was_running && wake_pipe_[1] >= 0) {
    const char b = 'x';
    if (::write(wake_pipe_[1], &b, 1) < 0) LogWarn("ipc", std::string("wake write failed: ") + std::strerror(errno));
  }
  if (listener_.joinable()) {
    if (listener_.get_id() == std::this_thread::get_id()) {
      listener_.detach();
    } else {
      listener_.join();
    }
  }

  std::list<std::shared_ptr<Connection>> conns;
  {
    std::lock_guard<std::mutex> lock(mu_);
    conns.swap(connections_);
  }
  for (auto& c : conns) ::shutdown(c->fd, SHUT_RDWR);
  for (auto& c : conns) {
    if (c->thread.joinable()) {
      if (c->thread.get_id() == std::this_thread::get_id()) {
        c->thread.detach();
        continue;
      }
      c->thread.join();
    }
    ::close(c->fd);
  }

  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (was_running) {
    ::unlink(socket_path_.c_str());
    LogInfo("ipc", "stopped " + socket_path_);
  }
  for (int& fd : wake_pipe_) {
    if (fd >= 0) ::close(fd);
    fd = -1;
  }
}

void IpcServer::ListenLoop() {
  while (running_.load()) {
    pollfd fds[2]{};
    fds[0].fd = listen_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_pipe_[0];
    fds[1].events = POLLIN;
    int ret = ::poll(fds, 2, -1);
    if (ret < 0) {
      if (errno == EINTR) continue;
      LogError("ipc", std::string("poll() failed: ") + std::strerror(errno));
      break;
    }
    if (fds[1].revents != 0) break;
    if (!(fds[0].revents & POLLIN)) continue;

    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) LogWarn("ipc", std::string("accept() failed: ") + std::strerror(errno));
      continue;
    }

    ReapFinished();
    std::lock_guard<std::mutex> lock(mu_);
    if (connections_.size() >= static_cast<size_t>(kMaxConnections)) {
      LogWarn("ipc", "max connections reached, rejecting");
      ::close(fd);
      continue;
    }
    auto conn = std::make_shared<Connection>();
    conn->fd = fd;
    connections_.push_back(conn);
    conn->thread = std::thread([this, conn]() { Serve(conn); });
  }
}

void IpcServer::ReapFinished() {
  std::vector<std::shared_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if ((*it)->done) {
        finished.push_back(*it);
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& c : finished) {
    if (c->thread.joinable()) c->thread.join();
    ::close(c->fd);
  }
}

void IpcServer::Serve(const std::shared_ptr<Connection>& conn) {
  FrameReader reader;
  char buf[4096];
  while (running_.load()) {
    pollfd fds[2]{};
    fds[0].fd = conn->fd;
    fds[0].events = POLLIN;
    fds[1].fd = wake_pipe_[0];
    fds[1].events = POLLIN;
    int ret = ::poll(fds, 2, -1);
    if (ret < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (fds[1].revents != 0) break;
    if (fds[0].revents == 0) continue;

    ssize_t n = ::read(conn->fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;

    auto fed = reader.Feed(buf, static_cast<size_t>(n));
    bool ok = true;
    for (const auto& line : fed.lines) {
      bool stop_requested = false;
      ok = WriteLine(conn->fd, HandleLine(line, &stop_requested).dump());
      if (stop_requested) ScheduleStop();
      if (!ok) break;
    }
    if (ok && fed.overflowed) {
      ok = WriteLine(conn->fd, MakeIpcResponse("unknown", ErrorResponse("Message too large")).dump());
    }
    if (!ok) break;
  }
  std::lock_guard<std::mutex> lock(mu_);
  conn->done = true;
}

nlohmann::json IpcServer::HandleLine(const std::string& line, bool* stop_requested) {
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) {
    return MakeIpcResponse("unknown", ErrorResponse("Invalid message format: not a JSON object"));
  }
  const std::string id = msg.contains("id") && msg["id"].is_string() ? msg["id"].get<std::string>() : "unknown";
  if (msg.value("kind", std::string()) != "request" || !msg.contains("command") || !msg["command"].is_object()) {
    return MakeIpcResponse(id, ErrorResponse("Expected a request message with command"));
  }

  const std::string type = msg["command"].value("type", std::string());
  auto command = ParseIpcCommandName(type);
  if (!command) return MakeIpcResponse(id, ErrorResponse("Unknown command type: " + type));

  IpcResponse response;
  try {
    switch (*command) {
      case IpcCommandType::kReload: {
        if (!handlers_.on_reload) return MakeIpcResponse(id, ErrorResponse("reload is not supported"));
        ReloadResult r = handlers_.on_reload();
        response.type = "ok";
        response.message = r.success ? "Reloaded " + std::to_string(r.reloaded_connectors.size()) + " connector(s)"
                                     : "Reload completed with errors";
        response.data = ReloadResultToJson(r);
        break;
      }
      case IpcCommandType::kStop:
        response.type = "ok";
        response.message = "Stopping gateway...";
        if (stop_requested) *stop_requested = true;
        break;
      case IpcCommandType::kStatus:
        if (!handlers_.on_status) return MakeIpcResponse(id, ErrorResponse("status is not supported"));
        response.type = "status";
        response.data = handlers_.on_status();
        break;
    }
  } catch (const std::exception& e) {
    response = ErrorResponse(e.what());
  }
  LogInfo("ipc", "command=" + type + " response=" + response.type);
  return MakeIpcResponse(id, response);
}

void IpcServer::ScheduleStop() {
  std::lock_guard<std::mutex> lock(mu_);
  if (stop_scheduled_) return;
  stop_scheduled_ = true;
  stop_thread_ = std::thread([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(kStopGraceMs));
    if (handlers_.on_stop) handlers_.on_stop();
  });
}

bool IpcServer::WriteLine(int fd, const std::string& line) {
  std::string data = line + "\n";
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

}  // namespace gateway

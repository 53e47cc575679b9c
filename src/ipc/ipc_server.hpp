#pragma once

#include "ipc/ipc_protocol.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gateway {

struct IpcHandlers {
  std::function<ReloadResult()> on_reload;
  std::function<void()> on_stop;
  std::function<nlohmann::json()> on_status;
};

// Control-channel listener on a Unix domain socket.
//
// Each accepted connection is served on its own thread and may carry any
// number of request lines; every request gets exactly one response line.
class IpcServer {
 public:
  static constexpr int kMaxConnections = 32;
  static constexpr int kStopGraceMs = 100;

  IpcServer(std::string socket_path, IpcHandlers handlers);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;

  bool Start(std::string* err);
  // Closes every connection, joins the worker threads and removes the socket
  // file. Safe to call from inside on_stop.
  void Stop();

  bool Running() const { return running_.load(); }
  const std::string& SocketPath() const { return socket_path_; }

  // Handles one request line. Sets *stop_requested for a stop command.
  nlohmann::json HandleLine(const std::string& line, bool* stop_requested);

 private:
  struct Connection {
    int fd = -1;
    std::thread thread;
    bool done = false;
  };

  void ListenLoop();
  void Serve(const std::shared_ptr<Connection>& conn);
  void ScheduleStop();
  void ReapFinished();
  bool WriteLine(int fd, const std::string& line);

  std::string socket_path_;
  IpcHandlers handlers_;
  int listen_fd_ = -1;
  int wake_pipe_[2] = {-1, -1};
  std::atomic<bool> running_{false};
  std::thread listener_;

  std::mutex mu_;
  std::list<std::shared_ptr<Connection>> connections_;
  std::thread stop_thread_;
  bool stop_scheduled_ = false;
};

}  // namespace gateway

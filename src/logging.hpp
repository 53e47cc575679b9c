#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace gateway {

enum class LogLevel { kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

struct LogEntry {
  int64_t unix_ms = 0;
  LogLevel level = LogLevel::kInfo;
  std::string tag;
  std::string message;
};

// Bounded queue of recent log lines. Observers are told the new line count
// after every append; they run outside the buffer lock.
class LogRingBuffer {
 public:
  using CountObserver = std::function<void(size_t count)>;

  explicit LogRingBuffer(size_t max_lines = 1000);

  void Append(LogEntry entry);
  std::vector<LogEntry> Snapshot() const;
  size_t Size() const;
  size_t Capacity() const;
  void SetCapacity(size_t max_lines);
  void Clear();

  // Returns an id usable with RemoveObserver.
  int AddObserver(CountObserver observer);
  void RemoveObserver(int id);

 private:
  size_t max_lines_;
  mutable std::mutex mu_;
  std::deque<LogEntry> lines_;
  int next_observer_id_ = 1;
  std::vector<std::pair<int, CountObserver>> observers_;
};

// Leveled logger for the gateway process. stdout belongs to the primary
// channel, so lines go to stderr. INFO is only printed in verbose mode but
// every level is captured by the ring buffer.
class Logger {
 public:
  static Logger& Instance();

  void SetVerbose(bool verbose);
  bool Verbose() const;

  void Info(const std::string& tag, const std::string& message);
  void Warn(const std::string& tag, const std::string& message);
  void Error(const std::string& tag, const std::string& message);
  void Log(LogLevel level, const std::string& tag, const std::string& message);

  LogRingBuffer& Buffer() { return buffer_; }

 private:
  Logger();

  mutable std::mutex mu_;
  bool verbose_ = false;
  LogRingBuffer buffer_;
};

inline void LogInfo(const std::string& tag, const std::string& message) { Logger::Instance().Info(tag, message); }
inline void LogWarn(const std::string& tag, const std::string& message) { Logger::Instance().Warn(tag, message); }
inline void LogError(const std::string& tag, const std::string& message) { Logger::Instance().Error(tag, message); }

std::string TruncateForLog(std::string s, size_t max_chars);
std::string SanitizeJsonForLog(const nlohmann::json& body);

}  // namespace gateway

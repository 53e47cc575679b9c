#include "logging.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <utility>

namespace gateway {
namespace {

static int64_t NowUnixMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static std::string ClockTime(int64_t unix_ms) {
  std::time_t t = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

static bool LooksSecret(std::string key) {
  for (auto& c : key) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  for (const char* needle : {"token", "secret", "password", "api_key", "apikey", "authorization", "bearer"}) {
    if (key.find(needle) != std::string::npos) return true;
  }
  return false;
}

static nlohmann::json RedactSecrets(const nlohmann::json& j) {
  if (j.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : j) out.push_back(RedactSecrets(item));
    return out;
  }
  if (!j.is_object()) return j;
  nlohmann::json out = nlohmann::json::object();
  for (auto it = j.begin(); it != j.end(); ++it) {
    out[it.key()] = LooksSecret(it.key()) ? nlohmann::json("***") : RedactSecrets(it.value());
  }
  return out;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

LogRingBuffer::LogRingBuffer(size_t max_lines) : max_lines_(max_lines == 0 ? 1 : max_lines) {}

void LogRingBuffer::Append(LogEntry entry) {
  size_t count = 0;
  std::vector<CountObserver> observers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    lines_.push_back(std::move(entry));
    while (lines_.size() > max_lines_) lines_.pop_front();
    count = lines_.size();
    observers.reserve(observers_.size());
    for (const auto& kv : observers_) observers.push_back(kv.second);
  }
  for (const auto& observer : observers) observer(count);
}

std::vector<LogEntry> LogRingBuffer::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::vector<LogEntry>(lines_.begin(), lines_.end());
}

size_t LogRingBuffer::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lines_.size();
}

size_t LogRingBuffer::Capacity() const {
  std::lock_guard<std::mutex> lock(mu_);
  return max_lines_;
}

void LogRingBuffer::SetCapacity(size_t max_lines) {
  std::lock_guard<std::mutex> lock(mu_);
  max_lines_ = max_lines == 0 ? 1 : max_lines;
  while (lines_.size() > max_lines_) lines_.pop_front();
}

void LogRingBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  lines_.clear();
}

int LogRingBuffer::AddObserver(CountObserver observer) {
  std::lock_guard<std::mutex> lock(mu_);
  const int id = next_observer_id_++;
  observers_.emplace_back(id, std::move(observer));
  return id;
}

void LogRingBuffer::RemoveObserver(int id) {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto it = observers_.begin(); it != observers_.end(); ++it) {
    if (it->first == id) {
      observers_.erase(it);
      return;
    }
  }
}

Logger::Logger() : buffer_(1000) {}

Logger& Logger::Instance() {
  static Logger logger;
  return logger;
}

void Logger::SetVerbose(bool verbose) {
  std::lock_guard<std::mutex> lock(mu_);
  verbose_ = verbose;
}

bool Logger::Verbose() const {
  std::lock_guard<std::mutex> lock(mu_);
  return verbose_;
}

void Logger::Info(const std::string& tag, const std::string& message) {
  Log(LogLevel::kInfo, tag, message);
}

void Logger::Warn(const std::string& tag, const std::string& message) {
  Log(LogLevel::kWarn, tag, message);
}

void Logger::Error(const std::string& tag, const std::string& message) {
  Log(LogLevel::kError, tag, message);
}

void Logger::Log(LogLevel level, const std::string& tag, const std::string& message) {
  LogEntry entry;
  entry.unix_ms = NowUnixMs();
  entry.level = level;
  entry.tag = tag;
  entry.message = message;

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (level != LogLevel::kInfo || verbose_) {
      std::cerr << "[" << ClockTime(entry.unix_ms) << "] [" << LogLevelName(level) << "] [" << tag << "] " << message
                << "\n";
    }
  }
  buffer_.Append(std::move(entry));
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  return RedactSecrets(body).dump();
}

}  // namespace gateway

#pragma once

#include "bridge.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct AuditRequest {
  CorrelationIds ids;
  std::string tool_name;
  nlohmann::json arguments;
  // Raw bridge token. Only the request record ever carries it.
  std::optional<std::string> session_token;
};

struct AuditResult {
  CorrelationIds ids;
  bool success = false;
  bool is_error = false;
  std::string error;
  int64_t duration_ms = 0;
};

struct AuditDelivery {
  CorrelationIds ids;
  bool delivered = false;
};

// Append-only records for UI-originated tool calls, keyed by correlation id.
class IAuditSink {
 public:
  virtual ~IAuditSink() = default;

  virtual void RecordRequest(const AuditRequest& record) = 0;
  virtual void RecordResult(const AuditResult& record) = 0;
  virtual void RecordDelivery(const AuditDelivery& record) = 0;
};

// Writes records as log lines. The token itself is never printed.
class LogAuditSink : public IAuditSink {
 public:
  void RecordRequest(const AuditRequest& record) override;
  void RecordResult(const AuditResult& record) override;
  void RecordDelivery(const AuditDelivery& record) override;
};

class MemoryAuditSink : public IAuditSink {
 public:
  struct Record {
    std::string kind;
    nlohmann::json payload;
  };

  void RecordRequest(const AuditRequest& record) override;
  void RecordResult(const AuditResult& record) override;
  void RecordDelivery(const AuditDelivery& record) override;

  std::vector<Record> Records() const;
  std::vector<Record> ForCorrelation(const std::string& correlation_id) const;

 private:
  void Append(std::string kind, nlohmann::json payload);

  mutable std::mutex mu_;
  std::vector<Record> records_;
};

}  // namespace gateway

#include "audit.hpp"

#include "logging.hpp"

#include <utility>

namespace gateway {

void LogAuditSink::RecordRequest(const AuditRequest& record) {
  LogInfo("audit", "request correlation=" + record.ids.correlation_id + " session=" + record.ids.ui_session_id +
                       " rpc=" + record.ids.ui_rpc_id + " fingerprint=" + record.ids.tool_call_fingerprint +
                       " tool=" + record.tool_name +
                       " arguments=" + TruncateForLog(SanitizeJsonForLog(record.arguments), 2000));
}

void LogAuditSink::RecordResult(const AuditResult& record) {
  LogInfo("audit", "result correlation=" + record.ids.correlation_id + " ok=" + (record.success ? "1" : "0") +
                       " is_error=" + (record.is_error ? "1" : "0") +
                       " error=" + (record.error.empty() ? "-" : record.error) +
                       " duration_ms=" + std::to_string(record.duration_ms));
}

void LogAuditSink::RecordDelivery(const AuditDelivery& record) {
  LogInfo("audit", "delivery correlation=" + record.ids.correlation_id +
                       " delivered=" + (record.delivered ? "1" : "0"));
}

void MemoryAuditSink::RecordRequest(const AuditRequest& record) {
  nlohmann::json j = CorrelationIdsToJson(record.ids);
  j["toolName"] = record.tool_name;
  j["arguments"] = record.arguments;
  if (record.session_token) j["sessionToken"] = *record.session_token;
  Append("request", std::move(j));
}

void MemoryAuditSink::RecordResult(const AuditResult& record) {
  nlohmann::json j = CorrelationIdsToJson(record.ids);
  j["success"] = record.success;
  j["isError"] = record.is_error;
  if (!record.error.empty()) j["error"] = record.error;
  j["durationMs"] = record.duration_ms;
  Append("result", std::move(j));
}

void MemoryAuditSink::RecordDelivery(const AuditDelivery& record) {
  nlohmann::json j = CorrelationIdsToJson(record.ids);
  j["delivered"] = record.delivered;
  Append("delivery", std::move(j));
}

std::vector<MemoryAuditSink::Record> MemoryAuditSink::Records() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_;
}

std::vector<MemoryAuditSink::Record> MemoryAuditSink::ForCorrelation(const std::string& correlation_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Record> out;
  for (const auto& r : records_) {
    if (r.payload.value("correlationId", std::string()) == correlation_id) out.push_back(r);
  }
  return out;
}

void MemoryAuditSink::Append(std::string kind, nlohmann::json payload) {
  std::lock_guard<std::mutex> lock(mu_);
  records_.push_back(Record{std::move(kind), std::move(payload)});
}

}  // namespace gateway

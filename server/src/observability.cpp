/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "lanxfer/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lanxfer {

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t live_records) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.live_records = live_records;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.device_id) {
    log_json["deviceId"] = *ctx.device_id;
  }
  if (ctx.record_id) {
    log_json["recordId"] = *ctx.record_id;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

void Observability::LogSuppressed(const std::string& name, const std::string& detail,
                                  const std::optional<std::string>& record_id) const {
  LogContext ctx;
  ctx.name = name;
  ctx.record_id = record_id;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace lanxfer

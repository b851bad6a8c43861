/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lanxfer {

struct LogContext {
  std::string trace_id;
  std::optional<std::string> device_id;
  std::optional<std::string> record_id;
  std::string name;
  long latency_ms{0};
  std::optional<int> status;
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t live_records{0};
};

class Observability {
 public:
  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t live_records) const;
  void Log(const LogContext& ctx) const;
  void LogSuppressed(const std::string& name, const std::string& detail,
                     const std::optional<std::string>& record_id = std::nullopt) const;

 private:
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace lanxfer

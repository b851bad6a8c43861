/*
 * 설명: 추가 전용 전송 이력 저장소 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_store_test.cpp, server/tests/it/history_log_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "lanxfer/transfer_record.hpp"

namespace lanxfer {

struct HistoryQuery {
  std::optional<std::string> device_id;
  std::size_t offset{0};
  std::optional<std::size_t> limit;
};

// 구현은 실패 시 std::exception 계열 예외를 던진다.
class HistoryLog {
 public:
  virtual ~HistoryLog() = default;

  virtual void EnsureSchema() = 0;
  virtual void Insert(const HistoryEntry& entry) = 0;
  // 상태가 앞으로 진행되는 경우에만 반영하고, 반영 여부를 돌려준다.
  virtual bool AdvanceStatus(const std::string& id, TransferStatus status) = 0;
  virtual std::optional<HistoryEntry> Find(const std::string& id) = 0;
  // (timestamp, id) 오름차순
  virtual std::vector<HistoryEntry> List(const HistoryQuery& query) = 0;
};

}  // namespace lanxfer

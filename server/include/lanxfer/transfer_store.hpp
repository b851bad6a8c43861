/*
 * 설명: 메모리상의 라이브 전송 레코드와 추가 전용 이력 로그를 함께 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_store_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanxfer/errors.hpp"
#include "lanxfer/history_log.hpp"
#include "lanxfer/observability.hpp"
#include "lanxfer/shared_state.hpp"
#include "lanxfer/transfer_record.hpp"

namespace lanxfer {

class TransferRecordStore {
 public:
  TransferRecordStore(std::shared_ptr<SharedState> state, std::shared_ptr<HistoryLog> history,
                      std::shared_ptr<Observability> observability);

  // 이력 기록(I/O)을 먼저 수행하고 성공했을 때만 라이브 맵에 게시한다.
  bool Create(const TransferRecord& record, ServiceError& error);
  bool AppendHistory(const HistoryEntry& entry, ServiceError& error);
  std::optional<TransferRecord> Get(const std::string& id);
  bool IsLive(const std::string& id);
  // 순위가 낮거나 같은 상태로의 전이는 변경 없이 성공으로 처리한다.
  bool UpdateStatus(const std::string& id, TransferStatus status, ServiceError& error);
  // 라이브 레코드를 제거하고 임시 레코드면 파일도 지운다. 파일 삭제 실패는 로그만 남긴다.
  bool RemoveAndReclaim(const std::string& id);
  // 라이브 레코드에 대한 저장 작업을 선점한다. 이미 저장 중이거나 레코드가 없으면 false.
  bool TryBeginSave(const std::string& id);
  void EndSave(const std::string& id);
  std::vector<TransferRecord> List(const std::optional<std::string>& device_filter);
  std::optional<std::vector<HistoryEntry>> History(const HistoryQuery& query, ServiceError& error);
  std::optional<HistoryEntry> FindHistory(const std::string& id, ServiceError& error);
  nlohmann::json PublicView(const HistoryEntry& entry, bool desktop_view);
  nlohmann::json PublicView(const std::vector<HistoryEntry>& entries, bool desktop_view);
  std::size_t LiveCount();

 private:
  std::shared_ptr<SharedState> state_;
  std::shared_ptr<HistoryLog> history_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, TransferRecord> live_;
  std::unordered_set<std::string> saving_;
};

}  // namespace lanxfer

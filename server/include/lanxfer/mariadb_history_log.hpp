/*
 * 설명: 전송 이력을 MariaDB transfer_history 테이블에 추가 전용으로 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/history_log_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "lanxfer/db_client.hpp"
#include "lanxfer/history_log.hpp"

namespace lanxfer {

class MariaDbHistoryLog : public HistoryLog {
 public:
  explicit MariaDbHistoryLog(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() override;
  void Insert(const HistoryEntry& entry) override;
  bool AdvanceStatus(const std::string& id, TransferStatus status) override;
  std::optional<HistoryEntry> Find(const std::string& id) override;
  std::vector<HistoryEntry> List(const HistoryQuery& query) override;

  // 통합 테스트 전용
  void ClearAll();

 private:
  std::vector<HistoryEntry> Select(MYSQL* conn, const std::string& sql) const;
  HistoryEntry BuildEntry(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace lanxfer

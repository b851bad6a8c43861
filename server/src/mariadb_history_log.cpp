/*
 * 설명: transfer_history 스키마 생성, 행 추가, 단조 상태 갱신, 정렬 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/history_log_it_test.cpp
 */
#include "lanxfer/mariadb_history_log.hpp"

#include <memory>
#include <sstream>

namespace lanxfer {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr const char* kSelectColumns =
    "SELECT id, device_id, device_name, file_name, file_path, direction, `timestamp`, status, `size`, source "
    "FROM transfer_history";

std::string ColumnText(MYSQL_ROW row, int index) { return row[index] ? std::string(row[index]) : std::string(); }

// 목표 상태보다 순위가 낮은 상태 목록
std::string LowerStatusList(TransferStatus status) {
  std::ostringstream oss;
  bool first = true;
  for (auto candidate : {TransferStatus::kSuccess, TransferStatus::kDownloaded, TransferStatus::kSaved}) {
    if (StatusRank(candidate) >= StatusRank(status)) {
      continue;
    }
    if (!first) {
      oss << ", ";
    }
    oss << "'" << ToString(candidate) << "'";
    first = false;
  }
  return oss.str();
}
}  // namespace

MariaDbHistoryLog::MariaDbHistoryLog(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbHistoryLog::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS transfer_history ("
                        " id VARCHAR(64) NOT NULL PRIMARY KEY,"
                        " device_id VARCHAR(128) NOT NULL,"
                        " device_name VARCHAR(255) NOT NULL,"
                        " file_name VARCHAR(1024) NOT NULL,"
                        " file_path TEXT NOT NULL,"
                        " direction VARCHAR(16) NOT NULL,"
                        " `timestamp` DATETIME(6) NOT NULL,"
                        " status VARCHAR(16) NOT NULL,"
                        " `size` BIGINT UNSIGNED NOT NULL DEFAULT 0,"
                        " source VARCHAR(16) NOT NULL DEFAULT 'mobile'"
                        ") DEFAULT CHARSET=utf8mb4;",
                        "이력 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE INDEX IF NOT EXISTS idx_transfer_history_device_ts "
                        "ON transfer_history(device_id, `timestamp`);",
                        "디바이스 인덱스 생성 실패");
    db_client_->Execute(conn,
                        "CREATE INDEX IF NOT EXISTS idx_transfer_history_ts ON transfer_history(`timestamp`);",
                        "시간 인덱스 생성 실패");
  });
}

void MariaDbHistoryLog::Insert(const HistoryEntry& entry) {
  bool sent_before = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    bool is_resend = sent_before;
    sent_before = true;
    std::ostringstream oss;
    oss << "INSERT INTO transfer_history(id, device_id, device_name, file_name, file_path, direction, `timestamp`, "
           "status, `size`, source) VALUES('"
        << db_client_->Escape(conn, entry.id) << "', '" << db_client_->Escape(conn, entry.device_id) << "', '"
        << db_client_->Escape(conn, entry.device_name) << "', '" << db_client_->Escape(conn, entry.file_name)
        << "', '" << db_client_->Escape(conn, entry.file_path) << "', '" << ToString(entry.direction) << "', '"
        << ToDbTimestamp(entry.timestamp) << "', '" << ToString(entry.status) << "', " << entry.size_bytes << ", '"
        << ToString(entry.source) << "');";
    auto sql = oss.str();
    if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
      // 이전 시도가 커밋된 뒤 응답만 유실됐다면 같은 id가 이미 들어가 있다.
      if (is_resend && mysql_errno(conn) == kDuplicateEntry) {
        return;
      }
      db_client_->RaiseError(conn, "이력 저장 실패");
    }
  });
}

bool MariaDbHistoryLog::AdvanceStatus(const std::string& id, TransferStatus status) {
  auto lower = LowerStatusList(status);
  if (lower.empty()) {
    return false;
  }
  bool advanced = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE transfer_history SET status='" << ToString(status) << "' WHERE id='"
        << db_client_->Escape(conn, id) << "' AND status IN (" << lower << ");";
    db_client_->Execute(conn, oss.str(), "이력 상태 갱신 실패");
    advanced = mysql_affected_rows(conn) > 0;
  });
  return advanced;
}

std::optional<HistoryEntry> MariaDbHistoryLog::Find(const std::string& id) {
  std::optional<HistoryEntry> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kSelectColumns << " WHERE id='" << db_client_->Escape(conn, id) << "' LIMIT 1;";
    auto rows = Select(conn, oss.str());
    if (!rows.empty()) {
      result = rows.front();
    }
  });
  return result;
}

std::vector<HistoryEntry> MariaDbHistoryLog::List(const HistoryQuery& query) {
  std::vector<HistoryEntry> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kSelectColumns;
    if (query.device_id) {
      oss << " WHERE device_id='" << db_client_->Escape(conn, *query.device_id) << "'";
    }
    oss << " ORDER BY `timestamp` ASC, id ASC";
    if (query.limit) {
      oss << " LIMIT " << *query.limit << " OFFSET " << query.offset;
    } else if (query.offset > 0) {
      oss << " LIMIT 18446744073709551615 OFFSET " << query.offset;
    }
    oss << ';';
    result = Select(conn, oss.str());
  });
  return result;
}

void MariaDbHistoryLog::ClearAll() {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM transfer_history;", "이력 초기화 실패"); });
}

std::vector<HistoryEntry> MariaDbHistoryLog::Select(MYSQL* conn, const std::string& sql) const {
  db_client_->Execute(conn, sql, "이력 조회 실패");
  std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> res(mysql_store_result(conn), &mysql_free_result);
  if (!res) {
    db_client_->RaiseError(conn, "이력 조회 결과 없음");
  }
  std::vector<HistoryEntry> entries;
  while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
    entries.push_back(BuildEntry(row));
  }
  return entries;
}

HistoryEntry MariaDbHistoryLog::BuildEntry(MYSQL_ROW row) const {
  HistoryEntry entry;
  entry.id = ColumnText(row, 0);
  entry.device_id = ColumnText(row, 1);
  entry.device_name = ColumnText(row, 2);
  entry.file_name = ColumnText(row, 3);
  entry.file_path = ColumnText(row, 4);
  entry.direction = ParseDirection(ColumnText(row, 5)).value_or(TransferDirection::kUpload);
  entry.timestamp = ParseDbTimestamp(ColumnText(row, 6));
  entry.status = ParseStatus(ColumnText(row, 7)).value_or(TransferStatus::kSuccess);
  auto size_text = ColumnText(row, 8);
  entry.size_bytes = size_text.empty() ? 0 : std::stoull(size_text);
  entry.source = ParseSource(ColumnText(row, 9)).value_or(TransferSource::kMobile);
  return entry;
}

}  // namespace lanxfer

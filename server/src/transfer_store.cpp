/*
 * 설명: 라이브 레코드 게시/조회/상태 전이/회수와 이력 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_store_test.cpp
 */
#include "lanxfer/transfer_store.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace lanxfer {

TransferRecordStore::TransferRecordStore(std::shared_ptr<SharedState> state, std::shared_ptr<HistoryLog> history,
                                         std::shared_ptr<Observability> observability)
    : state_(std::move(state)), history_(std::move(history)), observability_(std::move(observability)) {}

bool TransferRecordStore::Create(const TransferRecord& record, ServiceError& error) {
  if (!AppendHistory(ToHistoryEntry(record), error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  live_[record.id] = record;
  return true;
}

bool TransferRecordStore::AppendHistory(const HistoryEntry& entry, ServiceError& error) {
  try {
    history_->Insert(entry);
  } catch (const std::exception& ex) {
    error.Set(ErrorKind::kStorage, error_code::kStorageError, std::string("이력 기록 실패: ") + ex.what());
    return false;
  }
  return true;
}

std::optional<TransferRecord> TransferRecordStore::Get(const std::string& id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = live_.find(id);
  if (it == live_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TransferRecordStore::IsLive(const std::string& id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return live_.count(id) > 0;
}

bool TransferRecordStore::UpdateStatus(const std::string& id, TransferStatus status, ServiceError& error) {
  std::optional<TransferStatus> current;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = live_.find(id);
    if (it != live_.end()) {
      current = it->second.status;
    }
  }
  if (!current) {
    auto row = FindHistory(id, error);
    if (!row) {
      if (error.code.empty()) {
        error.Set(ErrorKind::kNotFound, error_code::kNotFound, "레코드가 없습니다");
      }
      return false;
    }
    current = row->status;
  }
  if (StatusRank(status) <= StatusRank(*current)) {
    return true;
  }

  try {
    history_->AdvanceStatus(id, status);
  } catch (const std::exception& ex) {
    error.Set(ErrorKind::kStorage, error_code::kStorageError, std::string("이력 상태 갱신 실패: ") + ex.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = live_.find(id);
  if (it != live_.end() && StatusRank(status) > StatusRank(it->second.status)) {
    it->second.status = status;
  }
  return true;
}

bool TransferRecordStore::RemoveAndReclaim(const std::string& id) {
  std::optional<TransferRecord> removed;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = live_.find(id);
    if (it == live_.end()) {
      return false;
    }
    removed = std::move(it->second);
    live_.erase(it);
  }
  if (!removed->is_transient || removed->file_path.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::remove(removed->file_path, ec);
  if (ec && observability_) {
    observability_->LogSuppressed("cleanup.suppressed", "임시 파일 삭제 실패: " + ec.message(), id);
  }
  return true;
}

bool TransferRecordStore::TryBeginSave(const std::string& id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (live_.count(id) == 0) {
    return false;
  }
  return saving_.insert(id).second;
}

void TransferRecordStore::EndSave(const std::string& id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  saving_.erase(id);
}

std::vector<TransferRecord> TransferRecordStore::List(const std::optional<std::string>& device_filter) {
  std::vector<TransferRecord> result;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    result.reserve(live_.size());
    for (const auto& [id, record] : live_) {
      if (device_filter && record.device_id != *device_filter) {
        continue;
      }
      result.push_back(record);
    }
  }
  if (device_filter) {
    for (auto& record : result) {
      record.file_path.clear();
    }
  }
  std::sort(result.begin(), result.end(), [](const TransferRecord& a, const TransferRecord& b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
  return result;
}

std::optional<std::vector<HistoryEntry>> TransferRecordStore::History(const HistoryQuery& query,
                                                                      ServiceError& error) {
  try {
    return history_->List(query);
  } catch (const std::exception& ex) {
    error.Set(ErrorKind::kStorage, error_code::kStorageError, std::string("이력 조회 실패: ") + ex.what());
    return std::nullopt;
  }
}

std::optional<HistoryEntry> TransferRecordStore::FindHistory(const std::string& id, ServiceError& error) {
  try {
    return history_->Find(id);
  } catch (const std::exception& ex) {
    error.Set(ErrorKind::kStorage, error_code::kStorageError, std::string("이력 조회 실패: ") + ex.what());
    return std::nullopt;
  }
}

nlohmann::json TransferRecordStore::PublicView(const HistoryEntry& entry, bool desktop_view) {
  return ToPublicJson(entry, desktop_view, IsLive(entry.id));
}

nlohmann::json TransferRecordStore::PublicView(const std::vector<HistoryEntry>& entries, bool desktop_view) {
  std::unordered_map<std::string, bool> live_ids;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& entry : entries) {
      live_ids[entry.id] = live_.count(entry.id) > 0;
    }
  }
  nlohmann::json list = nlohmann::json::array();
  for (const auto& entry : entries) {
    list.push_back(ToPublicJson(entry, desktop_view, live_ids[entry.id]));
  }
  return list;
}

std::size_t TransferRecordStore::LiveCount() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return live_.size();
}

}  // namespace lanxfer

#pragma once

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "lanxfer/history_log.hpp"

namespace lanxfer::tests::mocks {

// 단위 테스트용 메모리 이력 로그. fail_writes를 켜면 쓰기가 예외를 던진다.
class InMemoryHistoryLog : public HistoryLog {
 public:
  void EnsureSchema() override {}

  void Insert(const HistoryEntry& entry) override {
    if (fail_writes) {
      throw std::runtime_error("history unavailable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (rows_.count(entry.id) > 0) {
      throw std::runtime_error("duplicate history id");
    }
    rows_[entry.id] = entry;
  }

  bool AdvanceStatus(const std::string& id, TransferStatus status) override {
    if (fail_writes) {
      throw std::runtime_error("history unavailable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || StatusRank(status) <= StatusRank(it->second.status)) {
      return false;
    }
    it->second.status = status;
    return true;
  }

  std::optional<HistoryEntry> Find(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<HistoryEntry> List(const HistoryQuery& query) override {
    std::vector<HistoryEntry> result;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& [id, entry] : rows_) {
        if (!query.device_id || entry.device_id == *query.device_id) {
          result.push_back(entry);
        }
      }
    }
    std::sort(result.begin(), result.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
      if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
      }
      return a.id < b.id;
    });
    if (query.offset >= result.size()) {
      return {};
    }
    result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(query.offset));
    if (query.limit && result.size() > *query.limit) {
      result.resize(*query.limit);
    }
    return result;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
  }

  std::atomic<bool> fail_writes{false};

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, HistoryEntry> rows_;
};

}  // namespace lanxfer::tests::mocks

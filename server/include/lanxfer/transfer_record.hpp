/*
 * 설명: 전송 레코드/이력 행 모델과 문자열/JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lanxfer {

enum class TransferDirection { kUpload, kDownload };
enum class TransferStatus { kSuccess, kDownloaded, kSaved };
enum class TransferSource { kDesktop, kMobile };

struct TransferRecord {
  std::string id;
  std::string device_id;
  std::string device_name;
  std::string file_name;
  std::string file_path;
  TransferDirection direction{TransferDirection::kUpload};
  TransferStatus status{TransferStatus::kSuccess};
  std::uint64_t size_bytes{0};
  TransferSource source{TransferSource::kMobile};
  std::chrono::system_clock::time_point created_at;
  bool is_transient{false};
};

struct HistoryEntry {
  std::string id;
  std::string device_id;
  std::string device_name;
  std::string file_name;
  std::string file_path;
  TransferDirection direction{TransferDirection::kUpload};
  std::chrono::system_clock::time_point timestamp;
  TransferStatus status{TransferStatus::kSuccess};
  std::uint64_t size_bytes{0};
  TransferSource source{TransferSource::kMobile};
};

std::string_view ToString(TransferDirection direction);
std::string_view ToString(TransferStatus status);
std::string_view ToString(TransferSource source);
std::optional<TransferDirection> ParseDirection(std::string_view text);
std::optional<TransferStatus> ParseStatus(std::string_view text);
std::optional<TransferSource> ParseSource(std::string_view text);

// success < downloaded < saved. 상태는 순위가 오르는 방향으로만 바뀐다.
int StatusRank(TransferStatus status);

HistoryEntry ToHistoryEntry(const TransferRecord& record);

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point ParseDbTimestamp(const std::string& text);
std::string ToIsoString(std::chrono::system_clock::time_point tp);

// 데스크톱 뷰가 아니면 filePath를 비운다. live이면 downloadUrl을 채운다.
nlohmann::json ToPublicJson(const HistoryEntry& entry, bool desktop_view, bool live);

}  // namespace lanxfer

/*
 * 설명: 전송 레코드 열거형 변환, 타임스탬프 직렬화, 공개 JSON 뷰를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_store_test.cpp
 */
#include "lanxfer/transfer_record.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanxfer {

std::string_view ToString(TransferDirection direction) {
  return direction == TransferDirection::kUpload ? "upload" : "download";
}

std::string_view ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kSuccess:
      return "success";
    case TransferStatus::kDownloaded:
      return "downloaded";
    case TransferStatus::kSaved:
      return "saved";
  }
  return "success";
}

std::string_view ToString(TransferSource source) { return source == TransferSource::kDesktop ? "desktop" : "mobile"; }

std::optional<TransferDirection> ParseDirection(std::string_view text) {
  if (text == "upload") {
    return TransferDirection::kUpload;
  }
  if (text == "download") {
    return TransferDirection::kDownload;
  }
  return std::nullopt;
}

std::optional<TransferStatus> ParseStatus(std::string_view text) {
  if (text == "success") {
    return TransferStatus::kSuccess;
  }
  if (text == "downloaded") {
    return TransferStatus::kDownloaded;
  }
  if (text == "saved") {
    return TransferStatus::kSaved;
  }
  return std::nullopt;
}

std::optional<TransferSource> ParseSource(std::string_view text) {
  if (text == "desktop") {
    return TransferSource::kDesktop;
  }
  if (text == "mobile") {
    return TransferSource::kMobile;
  }
  return std::nullopt;
}

int StatusRank(TransferStatus status) {
  switch (status) {
    case TransferStatus::kSuccess:
      return 0;
    case TransferStatus::kDownloaded:
      return 1;
    case TransferStatus::kSaved:
      return 2;
  }
  return 0;
}

HistoryEntry ToHistoryEntry(const TransferRecord& record) {
  return HistoryEntry{record.id,        record.device_id,  record.device_name, record.file_name,
                      record.file_path, record.direction,  record.created_at,  record.status,
                      record.size_bytes, record.source};
}

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (seconds > tp) {
    seconds -= std::chrono::seconds(1);
  }
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
  auto tt = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}

std::chrono::system_clock::time_point ParseDbTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    return std::chrono::system_clock::time_point{};
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  if (iss.peek() == '.') {
    iss.get();
    std::string fraction;
    iss >> fraction;
    fraction.resize(6, '0');
    long micros = 0;
    try {
      micros = std::stol(fraction);
    } catch (const std::exception&) {
      micros = 0;
    }
    tp += std::chrono::microseconds(micros);
  }
  return tp;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json ToPublicJson(const HistoryEntry& entry, bool desktop_view, bool live) {
  return {{"id", entry.id},
          {"deviceId", entry.device_id},
          {"deviceName", entry.device_name},
          {"name", entry.file_name},
          {"filePath", desktop_view ? entry.file_path : std::string()},
          {"direction", ToString(entry.direction)},
          {"status", ToString(entry.status)},
          {"size", entry.size_bytes},
          {"source", ToString(entry.source)},
          {"createdAt", ToIsoString(entry.timestamp)},
          {"downloadUrl", live ? "/files/" + entry.id : std::string()}};
}

}  // namespace lanxfer

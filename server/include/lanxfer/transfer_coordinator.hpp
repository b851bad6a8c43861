/*
 * 설명: 업로드/다운로드/폴더 저장 흐름을 조율한다. 인가, 이름 충돌 해소, 임시 레코드 수명,
 *       레코드 저장소 갱신과 실시간 이벤트 발행을 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_coordinator_test.cpp, server/tests/e2e/transfer_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core/file.hpp>
#include <nlohmann/json.hpp>

#include "lanxfer/auth.hpp"
#include "lanxfer/device_registry.hpp"
#include "lanxfer/errors.hpp"
#include "lanxfer/observability.hpp"
#include "lanxfer/realtime.hpp"
#include "lanxfer/shared_state.hpp"
#include "lanxfer/transfer_record.hpp"
#include "lanxfer/transfer_store.hpp"
#include "lanxfer/trusted_origin.hpp"

namespace lanxfer {

inline constexpr std::uint64_t kMinUploadLimitBytes = 1ULL << 20;
inline constexpr std::uint64_t kMaxUploadLimitBytes = 100ULL << 30;
// 선언된 Content-Length는 multipart 오버헤드만큼 여유를 둔다.
inline constexpr std::uint64_t kContentLengthSlackBytes = 1ULL << 20;

struct RequestContext {
  std::string ip;
  std::optional<std::string> session_id;
  std::optional<std::string> device_id;
  std::optional<std::string> device_name;
};

struct Principal {
  bool trusted{false};
  DeviceIdentity device;
};

class ByteSource {
 public:
  virtual ~ByteSource() = default;
  // 0이면 입력 끝. 실패하면 nullopt와 함께 error를 채운다.
  virtual std::optional<std::size_t> Read(char* buffer, std::size_t capacity, ServiceError& error) = 0;
};

struct CoordinatorConfig {
  std::filesystem::path download_dir;
  std::filesystem::path transient_dir;
  std::uint64_t max_upload_bytes{10ULL << 30};
  std::size_t chunk_size{1 << 20};
};

struct RuntimeSettings {
  std::uint64_t max_upload_bytes{0};
  std::filesystem::path download_dir;
};

struct DownloadTicket {
  TransferRecord record;
  HistoryEntry download_entry;
  Principal requester;
};

struct SaveResult {
  std::filesystem::path saved_path;
  std::string file_name;
  std::filesystem::path download_dir;
};

class TransferCoordinator {
 public:
  TransferCoordinator(std::shared_ptr<SharedState> state, std::shared_ptr<TrustedOriginPolicy> origin_policy,
                      std::shared_ptr<SessionStore> sessions, std::shared_ptr<DeviceRegistry> devices,
                      std::shared_ptr<TransferRecordStore> store, std::shared_ptr<BroadcastHub> hub,
                      std::shared_ptr<Observability> observability, const CoordinatorConfig& config,
                      Clock clock = SystemClock());

  // 신뢰 출발지이거나 같은 IP의 유효 세션이어야 한다. 이어서 디바이스를 확정한다.
  std::optional<Principal> Authorize(const RequestContext& ctx, ServiceError& error);

  std::optional<HistoryEntry> Upload(const Principal& principal, const std::string& original_name,
                                     std::optional<std::uint64_t> declared_length, ByteSource& source,
                                     ServiceError& error);
  std::optional<HistoryEntry> UploadLocalPath(const Principal& principal, const std::string& raw_path,
                                              ServiceError& error);

  // 상태 갱신과 다운로드 이력 기록까지 수행한다. 호출자는 파일을 보낸 뒤 FinishDownload를 호출한다.
  std::optional<DownloadTicket> BeginDownload(const Principal& principal, const std::string& record_id,
                                              ServiceError& error);
  void FinishDownload(const DownloadTicket& ticket, bool fully_written);

  std::optional<SaveResult> Save(const Principal& principal, const std::string& record_id, ServiceError& error);

  std::optional<nlohmann::json> History(const Principal& principal, std::size_t offset,
                                        std::optional<std::size_t> limit, ServiceError& error);
  nlohmann::json InitSnapshot(const ClientConnection& connection);

  RuntimeSettings Settings();
  bool SetMaxUploadBytes(std::uint64_t value, ServiceError& error);
  bool SetDownloadDir(const std::string& raw_dir, ServiceError& error);

 private:
  std::optional<TransferRecord> OwnedLiveRecord(const Principal& principal, const std::string& record_id,
                                                ServiceError& error);
  bool StreamToFile(ByteSource& source, boost::beast::file& file, std::uint64_t cap, std::uint64_t& written,
                    ServiceError& error);
  void DiscardFile(const std::filesystem::path& path, const std::string& record_id);
  void PublishNewRecord(const HistoryEntry& entry, const std::string& target_device_id);
  void PublishStatus(const std::string& record_id, TransferStatus status, const std::string& target_device_id);

  std::shared_ptr<SharedState> state_;
  std::shared_ptr<TrustedOriginPolicy> origin_policy_;
  std::shared_ptr<SessionStore> sessions_;
  std::shared_ptr<DeviceRegistry> devices_;
  std::shared_ptr<TransferRecordStore> store_;
  std::shared_ptr<BroadcastHub> hub_;
  std::shared_ptr<Observability> observability_;
  CoordinatorConfig config_;
  Clock clock_;
};

}  // namespace lanxfer

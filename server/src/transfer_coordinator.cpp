/*
 * 설명: 전송 흐름 조율 구현. 디스크 I/O와 이력 기록은 공유 락 밖에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transfer_coordinator_test.cpp, server/tests/e2e/transfer_flow_test.cpp
 */
#include "lanxfer/transfer_coordinator.hpp"

#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

#include "lanxfer/file_naming.hpp"
#include "lanxfer/random.hpp"

namespace lanxfer {

namespace fs = std::filesystem;

namespace {
std::string TrimCopy(const std::string& text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

long long EpochSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// 저장 선점을 스코프 종료 시 해제한다.
class SaveClaim {
 public:
  SaveClaim(TransferRecordStore& store, std::string id) : store_(store), id_(std::move(id)) {}
  ~SaveClaim() { store_.EndSave(id_); }
  SaveClaim(const SaveClaim&) = delete;
  SaveClaim& operator=(const SaveClaim&) = delete;

 private:
  TransferRecordStore& store_;
  std::string id_;
};
}  // namespace

TransferCoordinator::TransferCoordinator(std::shared_ptr<SharedState> state,
                                         std::shared_ptr<TrustedOriginPolicy> origin_policy,
                                         std::shared_ptr<SessionStore> sessions,
                                         std::shared_ptr<DeviceRegistry> devices,
                                         std::shared_ptr<TransferRecordStore> store,
                                         std::shared_ptr<BroadcastHub> hub,
                                         std::shared_ptr<Observability> observability,
                                         const CoordinatorConfig& config, Clock clock)
    : state_(std::move(state)), origin_policy_(std::move(origin_policy)), sessions_(std::move(sessions)),
      devices_(std::move(devices)), store_(std::move(store)), hub_(std::move(hub)),
      observability_(std::move(observability)), config_(config), clock_(std::move(clock)) {}

std::optional<Principal> TransferCoordinator::Authorize(const RequestContext& ctx, ServiceError& error) {
  auto ip = TrustedOriginPolicy::Normalize(ctx.ip);
  bool trusted = origin_policy_->IsTrusted(ip);
  if (!trusted) {
    if (!ctx.session_id || ctx.session_id->empty() || !sessions_->Validate(*ctx.session_id, ip)) {
      error.Set(ErrorKind::kAuth, error_code::kUnauthorized, "인증되지 않은 접근입니다");
      return std::nullopt;
    }
  }
  auto device = devices_->Resolve(trusted, ctx.device_id, ctx.device_name, error);
  if (!device) {
    return std::nullopt;
  }
  return Principal{trusted, *device};
}

std::optional<HistoryEntry> TransferCoordinator::Upload(const Principal& principal, const std::string& original_name,
                                                        std::optional<std::uint64_t> declared_length,
                                                        ByteSource& source, ServiceError& error) {
  auto name = TrimCopy(original_name);
  if (name.empty()) {
    error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "업로드할 파일이 없습니다");
    return std::nullopt;
  }
  auto settings = Settings();
  if (declared_length && *declared_length > settings.max_upload_bytes + kContentLengthSlackBytes) {
    error.Set(ErrorKind::kLimitExceeded, error_code::kLimitExceeded, "업로드 파일이 크기 제한을 초과했습니다");
    return std::nullopt;
  }

  auto now = clock_();
  TransferRecord record;
  record.id = RandomHex(16);
  record.direction = TransferDirection::kUpload;
  record.status = TransferStatus::kSuccess;
  record.source = principal.trusted ? TransferSource::kDesktop : TransferSource::kMobile;
  record.created_at = now;

  boost::beast::file file;
  boost::beast::error_code ec;
  std::error_code fs_ec;
  fs::path destination;
  if (principal.trusted) {
    // 데스크톱이 보낸 파일은 최근 모바일 디바이스 앞으로 임시 보관한다.
    auto target = devices_->PreferredMobileDevice();
    record.device_id = target.id;
    record.device_name = target.name;
    record.file_name = name;
    record.is_transient = true;
    fs::create_directories(config_.transient_dir, fs_ec);
    if (fs_ec) {
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "임시 보관 디렉터리를 사용할 수 없습니다: " + fs_ec.message());
      return std::nullopt;
    }
    auto epoch = std::to_string(EpochSeconds(now));
    auto safe_name = SecureFilename(name);
    if (safe_name.empty()) {
      safe_name = "file-" + epoch;
    }
    destination = config_.transient_dir / (epoch + "_" + record.id + "_" + safe_name);
    file.open(destination.string().c_str(), boost::beast::file_mode::write_new, ec);
    if (ec) {
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "임시 파일을 만들 수 없습니다: " + ec.message());
      return std::nullopt;
    }
  } else {
    record.device_id = principal.device.id;
    record.device_name = principal.device.name;
    record.is_transient = false;
    fs::create_directories(settings.download_dir, fs_ec);
    if (fs_ec) {
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "저장 디렉터리를 사용할 수 없습니다: " + fs_ec.message());
      return std::nullopt;
    }
    auto reserved = ReserveUniqueFile(settings.download_dir, name, file, ec);
    if (!reserved) {
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "저장 파일을 만들 수 없습니다: " + ec.message());
      return std::nullopt;
    }
    destination = *reserved;
    record.file_name = destination.filename().string();
  }
  record.file_path = destination.string();

  std::uint64_t written = 0;
  bool streamed = StreamToFile(source, file, settings.max_upload_bytes, written, error);
  boost::beast::error_code close_ec;
  file.close(close_ec);
  if (streamed && close_ec) {
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "파일을 닫는 중 오류: " + close_ec.message());
    streamed = false;
  }
  if (!streamed) {
    DiscardFile(destination, record.id);
    return std::nullopt;
  }

  record.size_bytes = written;
  if (!store_->Create(record, error)) {
    DiscardFile(destination, record.id);
    return std::nullopt;
  }
  auto entry = ToHistoryEntry(record);
  PublishNewRecord(entry, record.device_id);
  return entry;
}

std::optional<HistoryEntry> TransferCoordinator::UploadLocalPath(const Principal& principal,
                                                                 const std::string& raw_path, ServiceError& error) {
  if (!principal.trusted) {
    error.Set(ErrorKind::kForbidden, error_code::kForbidden, "데스크톱에서만 로컬 파일을 보낼 수 있습니다");
    return std::nullopt;
  }
  auto trimmed = TrimCopy(raw_path);
  if (trimmed.empty()) {
    error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "filePath가 필요합니다");
    return std::nullopt;
  }
  fs::path path(trimmed);
  if (!path.is_absolute()) {
    error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "filePath는 절대 경로여야 합니다");
    return std::nullopt;
  }
  path = path.lexically_normal();
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    error.Set(ErrorKind::kNotFound, error_code::kNotFound, "파일이 존재하지 않습니다");
    return std::nullopt;
  }
  auto size = fs::file_size(path, ec);
  if (ec) {
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "파일 크기를 읽을 수 없습니다: " + ec.message());
    return std::nullopt;
  }

  auto target = devices_->PreferredMobileDevice();
  TransferRecord record;
  record.id = RandomHex(16);
  record.device_id = target.id;
  record.device_name = target.name;
  record.file_name = path.filename().string();
  record.file_path = path.string();
  record.direction = TransferDirection::kUpload;
  record.status = TransferStatus::kSuccess;
  record.size_bytes = size;
  record.source = TransferSource::kDesktop;
  record.created_at = clock_();
  record.is_transient = false;
  if (!store_->Create(record, error)) {
    return std::nullopt;
  }
  auto entry = ToHistoryEntry(record);
  PublishNewRecord(entry, record.device_id);
  return entry;
}

std::optional<DownloadTicket> TransferCoordinator::BeginDownload(const Principal& principal,
                                                                 const std::string& record_id, ServiceError& error) {
  auto record = OwnedLiveRecord(principal, record_id, error);
  if (!record) {
    return std::nullopt;
  }
  if (!store_->UpdateStatus(record->id, TransferStatus::kDownloaded, error)) {
    return std::nullopt;
  }
  HistoryEntry entry;
  entry.id = RandomHex(16);
  entry.device_id = principal.device.id;
  entry.device_name = principal.device.name;
  entry.file_name = record->file_name;
  entry.file_path = record->file_path;
  entry.direction = TransferDirection::kDownload;
  entry.timestamp = clock_();
  entry.status = TransferStatus::kSuccess;
  entry.size_bytes = record->size_bytes;
  entry.source = principal.trusted ? TransferSource::kDesktop : TransferSource::kMobile;
  if (!store_->AppendHistory(entry, error)) {
    return std::nullopt;
  }
  return DownloadTicket{*record, entry, principal};
}

void TransferCoordinator::FinishDownload(const DownloadTicket& ticket, bool fully_written) {
  PublishNewRecord(ticket.download_entry, ticket.requester.device.id);
  bool reclaimed = false;
  if (ticket.record.is_transient && fully_written) {
    reclaimed = store_->RemoveAndReclaim(ticket.record.id);
  }
  PublishStatus(ticket.record.id, TransferStatus::kDownloaded, ticket.record.device_id);
  if (reclaimed) {
    hub_->Publish("record_removed", {{"id", ticket.record.id}}, ticket.record.device_id);
  }
}

std::optional<SaveResult> TransferCoordinator::Save(const Principal& principal, const std::string& record_id,
                                                    ServiceError& error) {
  auto record = OwnedLiveRecord(principal, record_id, error);
  if (!record) {
    return std::nullopt;
  }
  if (!store_->TryBeginSave(record->id)) {
    if (store_->IsLive(record->id)) {
      error.Set(ErrorKind::kConflict, error_code::kSaveInProgress, "이미 저장 중인 파일입니다");
    } else {
      error.Set(ErrorKind::kNotFound, error_code::kNotFound, "파일이 존재하지 않습니다");
    }
    return std::nullopt;
  }
  SaveClaim claim(*store_, record->id);
  auto settings = Settings();
  std::error_code ec;
  fs::create_directories(settings.download_dir, ec);
  if (ec) {
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "저장 디렉터리를 사용할 수 없습니다: " + ec.message());
    return std::nullopt;
  }
  auto download_dir = fs::weakly_canonical(settings.download_dir, ec);
  if (ec) {
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "저장 디렉터리를 확인할 수 없습니다: " + ec.message());
    return std::nullopt;
  }
  auto source = fs::weakly_canonical(record->file_path, ec);
  if (ec) {
    error.Set(ErrorKind::kIo, error_code::kIoFailure, "원본 경로를 확인할 수 없습니다: " + ec.message());
    return std::nullopt;
  }

  fs::path target;
  bool copied = false;
  // 임시 레코드는 회수 시 원본이 지워지므로 항상 복사한다.
  if (!record->is_transient && source.parent_path() == download_dir) {
    target = source;
  } else {
    boost::beast::file out;
    boost::beast::error_code bec;
    auto reserved = ReserveUniqueFile(download_dir, record->file_name, out, bec);
    if (!reserved) {
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "저장 파일을 만들 수 없습니다: " + bec.message());
      return std::nullopt;
    }
    out.close(bec);
    fs::copy_file(source, *reserved, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      DiscardFile(*reserved, record->id);
      error.Set(ErrorKind::kIo, error_code::kIoFailure, "파일 복사 실패: " + ec.message());
      return std::nullopt;
    }
    target = *reserved;
    copied = true;
  }

  if (!store_->UpdateStatus(record->id, TransferStatus::kSaved, error)) {
    if (copied) {
      DiscardFile(target, record->id);
    }
    return std::nullopt;
  }

  auto desktop = DeviceRegistry::DesktopIdentity();
  HistoryEntry saved;
  saved.id = RandomHex(16);
  saved.device_id = desktop.id;
  saved.device_name = desktop.name;
  saved.file_name = target.filename().string();
  saved.file_path = target.string();
  saved.direction = TransferDirection::kDownload;
  saved.timestamp = clock_();
  saved.status = TransferStatus::kSuccess;
  saved.size_bytes = record->size_bytes;
  saved.source = TransferSource::kDesktop;
  if (!store_->AppendHistory(saved, error)) {
    return std::nullopt;
  }

  bool reclaimed = record->is_transient && store_->RemoveAndReclaim(record->id);
  PublishNewRecord(saved, desktop.id);
  PublishStatus(record->id, TransferStatus::kSaved, record->device_id);
  if (reclaimed) {
    hub_->Publish("record_removed", {{"id", record->id}}, record->device_id);
  }
  return SaveResult{target, target.filename().string(), download_dir};
}

std::optional<nlohmann::json> TransferCoordinator::History(const Principal& principal, std::size_t offset,
                                                           std::optional<std::size_t> limit, ServiceError& error) {
  HistoryQuery query;
  if (!principal.trusted) {
    query.device_id = principal.device.id;
  }
  query.offset = offset;
  query.limit = limit;
  auto entries = store_->History(query, error);
  if (!entries) {
    return std::nullopt;
  }
  return store_->PublicView(*entries, principal.trusted);
}

nlohmann::json TransferCoordinator::InitSnapshot(const ClientConnection& connection) {
  HistoryQuery query;
  if (!connection.is_desktop) {
    query.device_id = connection.device_id;
  }
  ServiceError error;
  auto entries = store_->History(query, error);
  if (!entries) {
    if (observability_) {
      observability_->LogSuppressed("ws.init_snapshot_failed", error.message);
    }
    return nlohmann::json::array();
  }
  return store_->PublicView(*entries, connection.is_desktop);
}

RuntimeSettings TransferCoordinator::Settings() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return RuntimeSettings{config_.max_upload_bytes, config_.download_dir};
}

bool TransferCoordinator::SetMaxUploadBytes(std::uint64_t value, ServiceError& error) {
  if (value < kMinUploadLimitBytes || value > kMaxUploadLimitBytes) {
    error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "업로드 제한은 1MiB 이상 100GiB 이하여야 합니다");
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  config_.max_upload_bytes = value;
  return true;
}

bool TransferCoordinator::SetDownloadDir(const std::string& raw_dir, ServiceError& error) {
  auto trimmed = TrimCopy(raw_dir);
  fs::path dir(trimmed);
  if (trimmed.empty() || !dir.is_absolute()) {
    error.Set(ErrorKind::kBadRequest, error_code::kBadRequest, "저장 디렉터리는 절대 경로여야 합니다");
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  config_.download_dir = dir.lexically_normal();
  return true;
}

std::optional<TransferRecord> TransferCoordinator::OwnedLiveRecord(const Principal& principal,
                                                                   const std::string& record_id,
                                                                   ServiceError& error) {
  auto record = store_->Get(record_id);
  if (!record) {
    error.Set(ErrorKind::kNotFound, error_code::kNotFound, "파일이 존재하지 않습니다");
    return std::nullopt;
  }
  if (!principal.trusted && record->device_id != principal.device.id) {
    error.Set(ErrorKind::kForbidden, error_code::kForbidden, "이 파일에 접근할 권한이 없습니다");
    return std::nullopt;
  }
  std::error_code ec;
  if (!fs::is_regular_file(record->file_path, ec)) {
    error.Set(ErrorKind::kNotFound, error_code::kNotFound, "원본 파일을 사용할 수 없습니다");
    return std::nullopt;
  }
  return record;
}

bool TransferCoordinator::StreamToFile(ByteSource& source, boost::beast::file& file, std::uint64_t cap,
                                       std::uint64_t& written, ServiceError& error) {
  std::vector<char> buffer(config_.chunk_size);
  while (true) {
    auto read = source.Read(buffer.data(), buffer.size(), error);
    if (!read) {
      return false;
    }
    if (*read == 0) {
      return true;
    }
    if (written + *read > cap) {
      error.Set(ErrorKind::kLimitExceeded, error_code::kLimitExceeded, "업로드 파일이 크기 제한을 초과했습니다");
      return false;
    }
    std::size_t offset = 0;
    while (offset < *read) {
      boost::beast::error_code ec;
      auto n = file.write(buffer.data() + offset, *read - offset, ec);
      if (ec || n == 0) {
        error.Set(ErrorKind::kIo, error_code::kIoFailure,
                  "파일 쓰기 실패: " + (ec ? ec.message() : std::string("기록된 바이트 없음")));
        return false;
      }
      offset += n;
    }
    written += *read;
  }
}

void TransferCoordinator::DiscardFile(const fs::path& path, const std::string& record_id) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec && observability_) {
    observability_->LogSuppressed("cleanup.suppressed", "부분 파일 삭제 실패: " + ec.message(), record_id);
  }
}

void TransferCoordinator::PublishNewRecord(const HistoryEntry& entry, const std::string& target_device_id) {
  hub_->Publish("new_record", {{"record", store_->PublicView(entry, false)}}, target_device_id);
}

void TransferCoordinator::PublishStatus(const std::string& record_id, TransferStatus status,
                                        const std::string& target_device_id) {
  nlohmann::json payload{{"id", record_id},
                         {"status", ToString(status)},
                         {"downloadUrl", store_->IsLive(record_id) ? "/files/" + record_id : std::string()}};
  hub_->Publish("record_updated", payload, target_device_id);
}

}  // namespace lanxfer

#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "lanxfer/random.hpp"
#include "lanxfer/transfer_coordinator.hpp"
#include "mocks/in_memory_history_log.hpp"
#include "mocks/recording_channel.hpp"

namespace {

namespace fs = std::filesystem;
using lanxfer::tests::mocks::InMemoryHistoryLog;
using lanxfer::tests::mocks::RecordingChannel;

const std::string kLanIp = "192.168.0.10";

class StringSource : public lanxfer::ByteSource {
 public:
  StringSource(std::string data, std::size_t step = 4096) : data_(std::move(data)), step_(step) {}

  std::optional<std::size_t> Read(char* buffer, std::size_t capacity, lanxfer::ServiceError&) override {
    ++reads_;
    auto n = std::min({capacity, step_, data_.size() - pos_});
    std::memcpy(buffer, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  int reads() const { return reads_; }

 private:
  std::string data_;
  std::size_t step_;
  std::size_t pos_{0};
  int reads_{0};
};

class BrokenSource : public lanxfer::ByteSource {
 public:
  std::optional<std::size_t> Read(char* buffer, std::size_t capacity, lanxfer::ServiceError& error) override {
    if (!sent_) {
      sent_ = true;
      auto n = std::min<std::size_t>(capacity, 10);
      std::memset(buffer, 'x', n);
      return n;
    }
    error.Set(lanxfer::ErrorKind::kIo, lanxfer::error_code::kIoFailure, "connection reset");
    return std::nullopt;
  }

 private:
  bool sent_{false};
};

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t CountFiles(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return 0;
  }
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

class TransferCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / ("lanxfer-coord-" + lanxfer::RandomHex(6));
    fs::create_directories(root_);
    Build(10ULL << 30);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void Build(std::uint64_t max_upload_bytes) {
    auto state = lanxfer::MakeSharedState();
    observability_ = std::make_shared<lanxfer::Observability>();
    lanxfer::PairingConfig pairing;
    issuer_ = std::make_shared<lanxfer::TokenIssuer>(state, pairing);
    sessions_ = std::make_shared<lanxfer::SessionStore>(state, issuer_, pairing);
    devices_ = std::make_shared<lanxfer::DeviceRegistry>(state);
    history_ = std::make_shared<InMemoryHistoryLog>();
    store_ = std::make_shared<lanxfer::TransferRecordStore>(state, history_, observability_);
    hub_ = std::make_shared<lanxfer::BroadcastHub>(state);
    lanxfer::CoordinatorConfig config;
    config.download_dir = root_ / "downloads";
    config.transient_dir = root_ / "transient";
    config.max_upload_bytes = max_upload_bytes;
    config.chunk_size = 64;
    coordinator_ = std::make_shared<lanxfer::TransferCoordinator>(
        state, std::make_shared<lanxfer::TrustedOriginPolicy>(kLanIp), sessions_, devices_, store_, hub_,
        observability_, config);
  }

  // 토큰 교환을 거쳐 모바일 주체를 만든다.
  lanxfer::Principal PairMobile(const std::string& ip, const std::string& device_id) {
    lanxfer::ServiceError error;
    auto token = issuer_->Issue(false);
    auto session_id = sessions_->Exchange(token.value, ip, std::nullopt, error);
    EXPECT_TRUE(session_id.has_value()) << error.code;
    auto principal =
        coordinator_->Authorize({ip, session_id, device_id, "Phone " + device_id}, error);
    EXPECT_TRUE(principal.has_value()) << error.code;
    return principal.value_or(lanxfer::Principal{});
  }

  lanxfer::Principal Desktop() {
    lanxfer::ServiceError error;
    auto principal = coordinator_->Authorize({"127.0.0.1", std::nullopt, std::nullopt, std::nullopt}, error);
    EXPECT_TRUE(principal.has_value());
    return principal.value_or(lanxfer::Principal{});
  }

  std::shared_ptr<RecordingChannel> Watch(bool is_desktop, const std::string& device_id) {
    auto channel = std::make_shared<RecordingChannel>();
    hub_->Register(hub_->NextConnectionId(), lanxfer::ClientConnection{is_desktop, device_id}, channel);
    channel->Clear();
    return channel;
  }

  lanxfer::HistoryEntry MustUpload(const lanxfer::Principal& principal, const std::string& name,
                                   const std::string& data) {
    StringSource source(data, 50);
    lanxfer::ServiceError error;
    auto entry = coordinator_->Upload(principal, name, data.size(), source, error);
    EXPECT_TRUE(entry.has_value()) << error.code << " " << error.message;
    return entry.value_or(lanxfer::HistoryEntry{});
  }

  fs::path root_;
  std::shared_ptr<lanxfer::Observability> observability_;
  std::shared_ptr<lanxfer::TokenIssuer> issuer_;
  std::shared_ptr<lanxfer::SessionStore> sessions_;
  std::shared_ptr<lanxfer::DeviceRegistry> devices_;
  std::shared_ptr<InMemoryHistoryLog> history_;
  std::shared_ptr<lanxfer::TransferRecordStore> store_;
  std::shared_ptr<lanxfer::BroadcastHub> hub_;
  std::shared_ptr<lanxfer::TransferCoordinator> coordinator_;
};

TEST_F(TransferCoordinatorTest, AuthorizeRequiresSessionFromSameIp) {
  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->Authorize({"192.168.0.20", std::nullopt, std::string("phone-a"), std::nullopt}, error));
  EXPECT_EQ(error.code, lanxfer::error_code::kUnauthorized);

  auto token = issuer_->Issue(false);
  auto session_id = sessions_->Exchange(token.value, "192.168.0.20", std::nullopt, error);
  ASSERT_TRUE(session_id.has_value());

  lanxfer::ServiceError moved;
  EXPECT_FALSE(coordinator_->Authorize({"192.168.0.21", session_id, std::string("phone-a"), std::nullopt}, moved));
  EXPECT_EQ(moved.kind, lanxfer::ErrorKind::kAuth);

  lanxfer::ServiceError no_device;
  EXPECT_FALSE(coordinator_->Authorize({"192.168.0.20", session_id, std::nullopt, std::nullopt}, no_device));
  EXPECT_EQ(no_device.code, lanxfer::error_code::kMissingDeviceId);

  auto desktop = coordinator_->Authorize({"::ffff:" + kLanIp, std::nullopt, std::nullopt, std::nullopt}, error);
  ASSERT_TRUE(desktop.has_value());
  EXPECT_TRUE(desktop->trusted);
  EXPECT_EQ(desktop->device.id, "desktop");
}

TEST_F(TransferCoordinatorTest, OversizedUploadLeavesNothingBehind) {
  Build(100);
  auto phone = PairMobile("192.168.0.20", "phone-a");

  StringSource source(std::string(101, 'a'), 7);
  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->Upload(phone, "big.bin", std::nullopt, source, error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kLimitExceeded);
  EXPECT_EQ(CountFiles(root_ / "downloads"), 0u);
  EXPECT_EQ(store_->LiveCount(), 0u);
  EXPECT_EQ(history_->size(), 0u);

  auto exact = MustUpload(phone, "exact.bin", std::string(100, 'b'));
  EXPECT_EQ(exact.size_bytes, 100u);
}

TEST_F(TransferCoordinatorTest, DeclaredLengthBeyondLimitIsRejectedBeforeReading) {
  Build(100);
  auto phone = PairMobile("192.168.0.20", "phone-a");
  StringSource source("abc");
  lanxfer::ServiceError error;
  EXPECT_FALSE(
      coordinator_->Upload(phone, "big.bin", 100 + lanxfer::kContentLengthSlackBytes + 1, source, error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kLimitExceeded);
  EXPECT_EQ(source.reads(), 0);
}

TEST_F(TransferCoordinatorTest, InterruptedUploadIsDiscarded) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  BrokenSource source;
  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->Upload(phone, "cut.bin", std::nullopt, source, error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kIo);
  EXPECT_EQ(CountFiles(root_ / "downloads"), 0u);

  StringSource empty_name("data");
  lanxfer::ServiceError name_error;
  EXPECT_FALSE(coordinator_->Upload(phone, "   ", std::nullopt, empty_name, name_error).has_value());
  EXPECT_EQ(name_error.kind, lanxfer::ErrorKind::kBadRequest);
}

TEST_F(TransferCoordinatorTest, HistoryFailureRemovesUploadedFile) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  history_->fail_writes = true;
  StringSource source("payload");
  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->Upload(phone, "a.txt", std::nullopt, source, error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kStorage);
  EXPECT_EQ(CountFiles(root_ / "downloads"), 0u);
  EXPECT_EQ(store_->LiveCount(), 0u);
}

TEST_F(TransferCoordinatorTest, RepeatedNamesGetCounterSuffix) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  EXPECT_EQ(MustUpload(phone, "report.pdf", "1").file_name, "report.pdf");
  EXPECT_EQ(MustUpload(phone, "report.pdf", "2").file_name, "report (1).pdf");
  EXPECT_EQ(MustUpload(phone, "report.pdf", "3").file_name, "report (2).pdf");
  EXPECT_EQ(ReadFile(root_ / "downloads" / "report (1).pdf"), "2");
}

TEST_F(TransferCoordinatorTest, NulInNameStillResolvesToDistinctFiles) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  const std::string name("a\0.txt", 6);
  auto first = MustUpload(phone, name, "1");
  auto second = MustUpload(phone, name, "2");
  EXPECT_EQ(first.file_name, "a_.txt");
  EXPECT_EQ(second.file_name, "a_ (1).txt");
  EXPECT_EQ(ReadFile(first.file_path), "1");
  EXPECT_EQ(ReadFile(second.file_path), "2");
  EXPECT_EQ(CountFiles(root_ / "downloads"), 2u);
}

TEST_F(TransferCoordinatorTest, MobileUploadNotifiesOwnerAndDesktop) {
  auto desktop_channel = Watch(true, "desktop");
  auto other_channel = Watch(false, "phone-b");
  auto phone = PairMobile("192.168.0.20", "phone-a");
  auto owner_channel = Watch(false, "phone-a");

  auto entry = MustUpload(phone, "photo.jpg", "jpeg-bytes");
  EXPECT_EQ(entry.source, lanxfer::TransferSource::kMobile);
  EXPECT_EQ(entry.device_id, "phone-a");

  auto events = owner_channel->Events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].first, "new_record");
  EXPECT_EQ(events[0].second["record"]["filePath"], "");
  EXPECT_EQ(events[0].second["record"]["downloadUrl"], "/files/" + entry.id);
  EXPECT_EQ(desktop_channel->EventNames(), std::vector<std::string>{"new_record"});
  EXPECT_TRUE(other_channel->EventNames().empty());
}

TEST_F(TransferCoordinatorTest, DesktopUploadIsTransientForLatestMobile) {
  PairMobile("192.168.0.20", "phone-a");
  PairMobile("192.168.0.21", "phone-b");
  auto entry = MustUpload(Desktop(), "notes.txt", "hello phone");

  EXPECT_EQ(entry.device_id, "phone-b");
  EXPECT_EQ(entry.source, lanxfer::TransferSource::kDesktop);
  auto record = store_->Get(entry.id);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->is_transient);
  fs::path path(record->file_path);
  EXPECT_EQ(path.parent_path().string(), (root_ / "transient").string());
  auto file_name = path.filename().string();
  EXPECT_NE(file_name.find("_" + entry.id + "_notes.txt"), std::string::npos);
  EXPECT_EQ(ReadFile(path), "hello phone");
}

TEST_F(TransferCoordinatorTest, DownloadDeliversExactBytesAndMarksDownloaded) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  std::string data(4096 + 17, '\0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(i % 251);
  }
  auto entry = MustUpload(phone, "blob.bin", data);

  lanxfer::ServiceError error;
  auto ticket = coordinator_->BeginDownload(phone, entry.id, error);
  ASSERT_TRUE(ticket.has_value()) << error.message;
  EXPECT_EQ(ticket->record.size_bytes, data.size());
  EXPECT_EQ(ReadFile(ticket->record.file_path), data);
  coordinator_->FinishDownload(*ticket, true);

  EXPECT_EQ(store_->Get(entry.id)->status, lanxfer::TransferStatus::kDownloaded);
  EXPECT_EQ(history_->Find(entry.id)->status, lanxfer::TransferStatus::kDownloaded);
  auto download_row = history_->Find(ticket->download_entry.id);
  ASSERT_TRUE(download_row.has_value());
  EXPECT_EQ(download_row->direction, lanxfer::TransferDirection::kDownload);
  EXPECT_EQ(download_row->device_id, "phone-a");
  EXPECT_TRUE(fs::exists(ticket->record.file_path));
}

TEST_F(TransferCoordinatorTest, OtherDevicesCannotTouchRecord) {
  auto phone_a = PairMobile("192.168.0.20", "phone-a");
  auto phone_b = PairMobile("192.168.0.21", "phone-b");
  auto entry = MustUpload(phone_a, "private.txt", "secret");

  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->BeginDownload(phone_b, entry.id, error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kForbidden);

  lanxfer::ServiceError save_error;
  EXPECT_FALSE(coordinator_->Save(phone_b, entry.id, save_error).has_value());
  EXPECT_EQ(save_error.kind, lanxfer::ErrorKind::kForbidden);

  lanxfer::ServiceError missing;
  EXPECT_FALSE(coordinator_->BeginDownload(phone_a, "does-not-exist", missing).has_value());
  EXPECT_EQ(missing.kind, lanxfer::ErrorKind::kNotFound);

  auto desktop_ticket = coordinator_->BeginDownload(Desktop(), entry.id, error);
  ASSERT_TRUE(desktop_ticket.has_value());
  coordinator_->FinishDownload(*desktop_ticket, true);

  auto history_b = coordinator_->History(phone_b, 0, std::nullopt, error);
  ASSERT_TRUE(history_b.has_value());
  EXPECT_TRUE(history_b->empty());
  auto history_a = coordinator_->History(phone_a, 0, std::nullopt, error);
  ASSERT_TRUE(history_a.has_value());
  ASSERT_EQ(history_a->size(), 1u);
  EXPECT_EQ((*history_a)[0]["filePath"], "");
  auto history_all = coordinator_->History(Desktop(), 0, std::nullopt, error);
  ASSERT_TRUE(history_all.has_value());
  EXPECT_EQ(history_all->size(), 2u);
}

TEST_F(TransferCoordinatorTest, TransientRecordIsReclaimedAfterFullDownload) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  auto owner_channel = Watch(false, "phone-a");
  auto entry = MustUpload(Desktop(), "push.txt", "pushed");
  auto path = store_->Get(entry.id)->file_path;

  lanxfer::ServiceError error;
  auto partial = coordinator_->BeginDownload(phone, entry.id, error);
  ASSERT_TRUE(partial.has_value());
  coordinator_->FinishDownload(*partial, false);
  EXPECT_TRUE(store_->IsLive(entry.id));

  auto ticket = coordinator_->BeginDownload(phone, entry.id, error);
  ASSERT_TRUE(ticket.has_value());
  coordinator_->FinishDownload(*ticket, true);
  EXPECT_FALSE(store_->IsLive(entry.id));
  EXPECT_FALSE(fs::exists(path));

  lanxfer::ServiceError again;
  EXPECT_FALSE(coordinator_->BeginDownload(phone, entry.id, again).has_value());
  EXPECT_EQ(again.kind, lanxfer::ErrorKind::kNotFound);

  auto names = owner_channel->EventNames();
  ASSERT_FALSE(names.empty());
  EXPECT_EQ(names.back(), "record_removed");
  EXPECT_EQ(history_->Find(entry.id)->status, lanxfer::TransferStatus::kDownloaded);
}

TEST_F(TransferCoordinatorTest, SavingTransientRecordCopiesAndReclaims) {
  PairMobile("192.168.0.20", "phone-a");
  auto entry = MustUpload(Desktop(), "memo.txt", "memo body");
  auto transient_path = store_->Get(entry.id)->file_path;

  lanxfer::ServiceError error;
  auto saved = coordinator_->Save(Desktop(), entry.id, error);
  ASSERT_TRUE(saved.has_value()) << error.message;
  EXPECT_EQ(saved->file_name, "memo.txt");
  EXPECT_EQ(ReadFile(saved->saved_path), "memo body");
  EXPECT_FALSE(fs::exists(transient_path));
  EXPECT_FALSE(store_->IsLive(entry.id));
  EXPECT_EQ(history_->Find(entry.id)->status, lanxfer::TransferStatus::kSaved);
  EXPECT_EQ(history_->size(), 2u);
}

TEST_F(TransferCoordinatorTest, SaveIsRejectedWhileAnotherSaveHoldsTheRecord) {
  PairMobile("192.168.0.20", "phone-a");
  auto entry = MustUpload(Desktop(), "memo.txt", "memo body");
  ASSERT_TRUE(store_->TryBeginSave(entry.id));

  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->Save(Desktop(), entry.id, error));
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kConflict);
  EXPECT_EQ(error.code, lanxfer::error_code::kSaveInProgress);
  EXPECT_EQ(CountFiles(root_ / "downloads"), 0u);
  EXPECT_EQ(history_->size(), 1u);

  store_->EndSave(entry.id);
  lanxfer::ServiceError retry_error;
  EXPECT_TRUE(coordinator_->Save(Desktop(), entry.id, retry_error).has_value()) << retry_error.message;
}

TEST_F(TransferCoordinatorTest, ConcurrentSavesOfTransientRecordCopyOnce) {
  PairMobile("192.168.0.20", "phone-a");
  auto entry = MustUpload(Desktop(), "memo.txt", std::string(64 * 1024, 'm'));
  std::atomic<int> succeeded{0};
  auto save = [&] {
    lanxfer::ServiceError error;
    if (coordinator_->Save(Desktop(), entry.id, error)) {
      ++succeeded;
    } else {
      EXPECT_TRUE(error.kind == lanxfer::ErrorKind::kConflict || error.kind == lanxfer::ErrorKind::kNotFound)
          << error.code;
    }
  };
  std::thread first(save);
  std::thread second(save);
  first.join();
  second.join();

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(CountFiles(root_ / "downloads"), 1u);
  EXPECT_EQ(history_->size(), 2u);
  EXPECT_FALSE(store_->IsLive(entry.id));
}

TEST_F(TransferCoordinatorTest, SavingRecordAlreadyInDownloadDirIsInPlace) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  auto entry = MustUpload(phone, "doc.txt", "contents");

  lanxfer::ServiceError error;
  auto saved = coordinator_->Save(Desktop(), entry.id, error);
  ASSERT_TRUE(saved.has_value()) << error.message;
  EXPECT_EQ(saved->file_name, "doc.txt");
  EXPECT_EQ(CountFiles(root_ / "downloads"), 1u);
  EXPECT_TRUE(store_->IsLive(entry.id));
  EXPECT_EQ(store_->Get(entry.id)->status, lanxfer::TransferStatus::kSaved);

  auto ticket = coordinator_->BeginDownload(phone, entry.id, error);
  ASSERT_TRUE(ticket.has_value());
  EXPECT_EQ(store_->Get(entry.id)->status, lanxfer::TransferStatus::kSaved);
}

TEST_F(TransferCoordinatorTest, SavingToAnotherDirectoryCopiesWithCollisionNaming) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  auto entry = MustUpload(phone, "doc.txt", "contents");
  auto archive = root_ / "archive";
  fs::create_directories(archive);
  std::ofstream(archive / "doc.txt") << "older";

  lanxfer::ServiceError error;
  ASSERT_TRUE(coordinator_->SetDownloadDir(archive.string(), error));
  auto saved = coordinator_->Save(Desktop(), entry.id, error);
  ASSERT_TRUE(saved.has_value()) << error.message;
  EXPECT_EQ(saved->file_name, "doc (1).txt");
  EXPECT_EQ(ReadFile(archive / "doc.txt"), "older");
  EXPECT_EQ(ReadFile(archive / "doc (1).txt"), "contents");
}

TEST_F(TransferCoordinatorTest, ConcurrentUploadsFromTwoDevicesStayIntact) {
  auto phone_a = PairMobile("192.168.0.20", "phone-a");
  auto phone_b = PairMobile("192.168.0.21", "phone-b");
  const std::size_t size = 200 * 1024;
  std::atomic<int> failures{0};
  lanxfer::HistoryEntry entry_a;
  lanxfer::HistoryEntry entry_b;

  auto upload = [&](const lanxfer::Principal& principal, char fill, lanxfer::HistoryEntry& out) {
    StringSource source(std::string(size, fill), 1000);
    lanxfer::ServiceError error;
    auto entry = coordinator_->Upload(principal, "same.bin", size, source, error);
    if (!entry) {
      ++failures;
      return;
    }
    out = *entry;
  };
  std::thread first(upload, std::cref(phone_a), 'a', std::ref(entry_a));
  std::thread second(upload, std::cref(phone_b), 'b', std::ref(entry_b));
  first.join();
  second.join();

  ASSERT_EQ(failures.load(), 0);
  EXPECT_NE(entry_a.file_path, entry_b.file_path);
  EXPECT_EQ(ReadFile(entry_a.file_path), std::string(size, 'a'));
  EXPECT_EQ(ReadFile(entry_b.file_path), std::string(size, 'b'));
  EXPECT_EQ(store_->LiveCount(), 2u);
}

TEST_F(TransferCoordinatorTest, LocalPathUploadIsDesktopOnly) {
  auto phone = PairMobile("192.168.0.20", "phone-a");
  auto local = root_ / "local.txt";
  std::ofstream(local) << "local file";

  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->UploadLocalPath(phone, local.string(), error).has_value());
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kForbidden);

  lanxfer::ServiceError relative;
  EXPECT_FALSE(coordinator_->UploadLocalPath(Desktop(), "local.txt", relative).has_value());
  EXPECT_EQ(relative.kind, lanxfer::ErrorKind::kBadRequest);

  lanxfer::ServiceError missing;
  EXPECT_FALSE(coordinator_->UploadLocalPath(Desktop(), (root_ / "nope.txt").string(), missing).has_value());
  EXPECT_EQ(missing.kind, lanxfer::ErrorKind::kNotFound);

  auto entry = coordinator_->UploadLocalPath(Desktop(), local.string(), error);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->device_id, "phone-a");
  EXPECT_EQ(entry->size_bytes, std::string("local file").size());
  EXPECT_FALSE(store_->Get(entry->id)->is_transient);
}

TEST_F(TransferCoordinatorTest, InitSnapshotIsScopedToConnection) {
  auto phone_a = PairMobile("192.168.0.20", "phone-a");
  auto phone_b = PairMobile("192.168.0.21", "phone-b");
  MustUpload(phone_a, "a.txt", "a");
  MustUpload(phone_b, "b.txt", "b");

  auto mobile = coordinator_->InitSnapshot({false, "phone-a"});
  ASSERT_EQ(mobile.size(), 1u);
  EXPECT_EQ(mobile[0]["deviceId"], "phone-a");
  EXPECT_EQ(coordinator_->InitSnapshot({true, "desktop"}).size(), 2u);
}

TEST_F(TransferCoordinatorTest, SettingsAreValidated) {
  lanxfer::ServiceError error;
  EXPECT_FALSE(coordinator_->SetMaxUploadBytes(1024, error));
  EXPECT_EQ(error.kind, lanxfer::ErrorKind::kBadRequest);
  EXPECT_FALSE(coordinator_->SetMaxUploadBytes(lanxfer::kMaxUploadLimitBytes + 1, error));
  EXPECT_TRUE(coordinator_->SetMaxUploadBytes(lanxfer::kMinUploadLimitBytes, error));
  EXPECT_EQ(coordinator_->Settings().max_upload_bytes, lanxfer::kMinUploadLimitBytes);

  EXPECT_FALSE(coordinator_->SetDownloadDir("relative/dir", error));
  EXPECT_FALSE(coordinator_->SetDownloadDir("  ", error));
  EXPECT_TRUE(coordinator_->SetDownloadDir((root_ / "x" / ".." / "y").string(), error));
  EXPECT_EQ(coordinator_->Settings().download_dir.string(), (root_ / "y").lexically_normal().string());
}

}  // namespace

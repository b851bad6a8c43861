/*
 * 설명: 실시간 연결을 디바이스 가시성 메타데이터와 함께 등록하고 레코드 이벤트를 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanxfer/observability.hpp"
#include "lanxfer/shared_state.hpp"

namespace lanxfer {

struct ClientConnection {
  bool is_desktop{false};
  std::string device_id;
};

class ClientChannel {
 public:
  virtual ~ClientChannel() = default;
  // 차단하지 않는다. 연결이 더 이상 쓸 수 없으면 false.
  virtual bool Deliver(const std::string& event, const nlohmann::json& payload) = 0;
};

class BroadcastHub {
 public:
  using SnapshotProvider = std::function<nlohmann::json(const ClientConnection&)>;

  explicit BroadcastHub(std::shared_ptr<SharedState> state);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void SetSnapshotProvider(SnapshotProvider provider);

  std::uint64_t NextConnectionId() { return next_connection_id_.fetch_add(1); }
  // 스냅샷은 락 없이 조회하고, init을 보낸 뒤 그 사이 발행된 이벤트를 순서대로 보낸다.
  // 전달에 실패하면 등록하지 않는다.
  bool Register(std::uint64_t connection_id, const ClientConnection& connection,
                const std::shared_ptr<ClientChannel>& channel);
  void Unregister(std::uint64_t connection_id);
  // 데스크톱 연결은 모두 받고, 모바일 연결은 대상이 없거나 자신의 device_id일 때만 받는다.
  std::size_t Publish(const std::string& event, const nlohmann::json& payload,
                      const std::optional<std::string>& target_device_id);
  std::size_t ActiveConnections();

 private:
  using PendingEvent = std::pair<std::string, nlohmann::json>;

  struct Entry {
    ClientConnection connection;
    std::weak_ptr<ClientChannel> channel;
    bool ready{false};
    std::vector<PendingEvent> pending;
  };

  static bool IsVisible(const ClientConnection& connection, const std::optional<std::string>& target_device_id);
  void UpdateGaugeLocked();

  std::shared_ptr<SharedState> state_;
  std::unordered_map<std::uint64_t, Entry> connections_;
  // 발행 순서를 연결별 전달 순서로 유지한다. 공유 도메인 락과는 별개다.
  std::mutex delivery_mutex_;
  std::atomic<std::uint64_t> next_connection_id_{1};
  SnapshotProvider snapshot_provider_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace lanxfer

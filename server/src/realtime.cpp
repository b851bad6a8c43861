/*
 * 설명: 연결 목록을 락 안에서 복사한 뒤 락 밖에서 이벤트를 전달하고, 실패한 연결만 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp
 */
#include "lanxfer/realtime.hpp"

#include <utility>
#include <vector>

namespace lanxfer {

BroadcastHub::BroadcastHub(std::shared_ptr<SharedState> state) : state_(std::move(state)) {}

void BroadcastHub::SetSnapshotProvider(SnapshotProvider provider) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  snapshot_provider_ = std::move(provider);
}

bool BroadcastHub::Register(std::uint64_t connection_id, const ClientConnection& connection,
                            const std::shared_ptr<ClientChannel>& channel) {
  if (!channel) {
    return false;
  }
  // 스냅샷 조회(이력 저장소 I/O) 동안 발행된 이벤트는 pending에 쌓였다가 init 뒤에 전달된다.
  SnapshotProvider provider;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    connections_[connection_id] = Entry{connection, channel, false, {}};
    provider = snapshot_provider_;
  }
  nlohmann::json records = provider ? provider(connection) : nlohmann::json::array();

  std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
  std::vector<PendingEvent> pending;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return false;
    }
    pending = std::move(it->second.pending);
    it->second.pending.clear();
  }
  bool delivered = channel->Deliver("init", {{"records", records}});
  for (auto event = pending.begin(); delivered && event != pending.end(); ++event) {
    delivered = channel->Deliver(event->first, event->second);
  }

  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = connections_.find(connection_id);
  if (!delivered || it == connections_.end()) {
    connections_.erase(connection_id);
    UpdateGaugeLocked();
    return false;
  }
  it->second.ready = true;
  UpdateGaugeLocked();
  return true;
}

void BroadcastHub::Unregister(std::uint64_t connection_id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (connections_.erase(connection_id) > 0) {
    UpdateGaugeLocked();
  }
}

std::size_t BroadcastHub::Publish(const std::string& event, const nlohmann::json& payload,
                                  const std::optional<std::string>& target_device_id) {
  std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
  std::vector<std::pair<std::uint64_t, std::weak_ptr<ClientChannel>>> targets;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    targets.reserve(connections_.size());
    for (auto& [id, entry] : connections_) {
      if (!IsVisible(entry.connection, target_device_id)) {
        continue;
      }
      if (entry.ready) {
        targets.emplace_back(id, entry.channel);
      } else {
        entry.pending.emplace_back(event, payload);
      }
    }
  }

  std::size_t delivered = 0;
  std::vector<std::uint64_t> dead;
  for (auto& [id, weak_channel] : targets) {
    auto channel = weak_channel.lock();
    if (channel && channel->Deliver(event, payload)) {
      ++delivered;
    } else {
      dead.push_back(id);
    }
  }

  if (!dead.empty()) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto id : dead) {
      connections_.erase(id);
    }
    UpdateGaugeLocked();
  }
  return delivered;
}

std::size_t BroadcastHub::ActiveConnections() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return connections_.size();
}

bool BroadcastHub::IsVisible(const ClientConnection& connection, const std::optional<std::string>& target_device_id) {
  if (connection.is_desktop) {
    return true;
  }
  return !target_device_id || target_device_id->empty() || *target_device_id == connection.device_id;
}

void BroadcastHub::UpdateGaugeLocked() {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace lanxfer

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "lanxfer/realtime.hpp"
#include "mocks/recording_channel.hpp"

namespace {

using lanxfer::tests::mocks::RecordingChannel;

class BroadcastHubTest : public ::testing::Test {
 protected:
  void SetUp() override {
    hub_ = std::make_shared<lanxfer::BroadcastHub>(lanxfer::MakeSharedState());
    observability_ = std::make_shared<lanxfer::Observability>();
    hub_->SetObservability(observability_);
  }

  std::shared_ptr<RecordingChannel> Connect(bool is_desktop, const std::string& device_id) {
    auto channel = std::make_shared<RecordingChannel>();
    EXPECT_TRUE(hub_->Register(hub_->NextConnectionId(), lanxfer::ClientConnection{is_desktop, device_id}, channel));
    channel->Clear();
    return channel;
  }

  std::shared_ptr<lanxfer::BroadcastHub> hub_;
  std::shared_ptr<lanxfer::Observability> observability_;
};

TEST_F(BroadcastHubTest, RegisterDeliversInitSnapshotFirst) {
  hub_->SetSnapshotProvider([](const lanxfer::ClientConnection& connection) {
    return nlohmann::json::array({{{"deviceId", connection.device_id}}});
  });
  auto channel = std::make_shared<RecordingChannel>();
  ASSERT_TRUE(hub_->Register(hub_->NextConnectionId(), lanxfer::ClientConnection{false, "phone-a"}, channel));
  hub_->Publish("new_record", {{"id", "r1"}}, std::nullopt);

  auto events = channel->Events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].first, "init");
  EXPECT_EQ(events[0].second["records"][0]["deviceId"], "phone-a");
  EXPECT_EQ(events[1].first, "new_record");
  EXPECT_EQ(observability_->Snapshot(0, 0).websocket_active, 1u);
}

TEST_F(BroadcastHubTest, SlowSnapshotDoesNotBlockPublishing) {
  auto desktop = Connect(true, "desktop");
  std::promise<void> snapshot_started;
  std::promise<void> release_snapshot;
  auto released = release_snapshot.get_future().share();
  hub_->SetSnapshotProvider([&snapshot_started, released](const lanxfer::ClientConnection&) {
    snapshot_started.set_value();
    released.wait();
    return nlohmann::json::array();
  });

  auto phone = std::make_shared<RecordingChannel>();
  auto registering = std::async(std::launch::async, [&] {
    return hub_->Register(hub_->NextConnectionId(), lanxfer::ClientConnection{false, "phone-a"}, phone);
  });
  snapshot_started.get_future().wait();

  auto publishing = std::async(std::launch::async, [&] { return hub_->Publish("new_record", {{"id", "r1"}}, "phone-a"); });
  auto state = publishing.wait_for(std::chrono::seconds(2));
  release_snapshot.set_value();
  ASSERT_EQ(state, std::future_status::ready);
  EXPECT_EQ(publishing.get(), 1u);
  ASSERT_TRUE(registering.get());

  EXPECT_EQ(desktop->EventNames(), (std::vector<std::string>{"new_record"}));
  EXPECT_EQ(phone->EventNames(), (std::vector<std::string>{"init", "new_record"}));
  hub_->Publish("record_removed", {{"id", "r1"}}, "phone-a");
  EXPECT_EQ(phone->EventNames(), (std::vector<std::string>{"init", "new_record", "record_removed"}));
}

TEST_F(BroadcastHubTest, RegisterFailsWhenInitCannotBeDelivered) {
  auto channel = std::make_shared<RecordingChannel>();
  channel->alive = false;
  EXPECT_FALSE(hub_->Register(hub_->NextConnectionId(), lanxfer::ClientConnection{true, "desktop"}, channel));
  EXPECT_EQ(hub_->ActiveConnections(), 0u);
}

TEST_F(BroadcastHubTest, TargetedEventsReachOwnerAndDesktopOnly) {
  auto desktop = Connect(true, "desktop");
  auto phone_a = Connect(false, "phone-a");
  auto phone_b = Connect(false, "phone-b");

  EXPECT_EQ(hub_->Publish("record_updated", {{"id", "r1"}}, std::string("phone-a")), 2u);
  EXPECT_EQ(desktop->EventNames(), std::vector<std::string>{"record_updated"});
  EXPECT_EQ(phone_a->EventNames(), std::vector<std::string>{"record_updated"});
  EXPECT_TRUE(phone_b->EventNames().empty());

  EXPECT_EQ(hub_->Publish("record_removed", {{"id", "r1"}}, std::nullopt), 3u);
  EXPECT_EQ(phone_b->EventNames(), std::vector<std::string>{"record_removed"});
}

TEST_F(BroadcastHubTest, DeadConnectionsAreDroppedWithoutAffectingOthers) {
  auto healthy = Connect(false, "phone-a");
  auto broken = Connect(false, "phone-a");
  auto released = Connect(true, "desktop");
  broken->alive = false;
  released.reset();

  EXPECT_EQ(hub_->Publish("new_record", {{"id", "r1"}}, std::string("phone-a")), 1u);
  EXPECT_EQ(hub_->ActiveConnections(), 1u);
  EXPECT_EQ(healthy->EventNames(), std::vector<std::string>{"new_record"});
  EXPECT_EQ(observability_->Snapshot(0, 0).websocket_active, 1u);
}

TEST_F(BroadcastHubTest, UnregisterStopsDelivery) {
  auto channel = std::make_shared<RecordingChannel>();
  auto id = hub_->NextConnectionId();
  ASSERT_TRUE(hub_->Register(id, lanxfer::ClientConnection{true, "desktop"}, channel));
  hub_->Unregister(id);
  EXPECT_EQ(hub_->Publish("new_record", {{"id", "r1"}}, std::nullopt), 0u);
  EXPECT_EQ(channel->EventNames(), std::vector<std::string>{"init"});
}

TEST_F(BroadcastHubTest, ConcurrentPublishersProduceOneOrderForEveryConnection) {
  auto first = Connect(true, "desktop");
  auto second = Connect(false, "phone-a");

  std::vector<std::thread> publishers;
  for (int t = 0; t < 4; ++t) {
    publishers.emplace_back([this, t] {
      for (int i = 0; i < 50; ++i) {
        hub_->Publish("new_record", {{"id", std::to_string(t) + "-" + std::to_string(i)}}, std::nullopt);
      }
    });
  }
  for (auto& publisher : publishers) {
    publisher.join();
  }

  auto first_events = first->Events();
  auto second_events = second->Events();
  ASSERT_EQ(first_events.size(), 200u);
  ASSERT_EQ(second_events.size(), 200u);
  for (std::size_t i = 0; i < first_events.size(); ++i) {
    EXPECT_EQ(first_events[i].second["id"], second_events[i].second["id"]);
  }
}

}  // namespace

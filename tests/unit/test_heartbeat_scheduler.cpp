#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "room/heartbeat_scheduler.h"
#include "room/stale_room_janitor.h"
#include "mocks/mock_room_connection.h"

using namespace syncroom::engine;
using syncroom::engine::protocol::MessageType;
using syncroom::engine::testing::RecordingRoomConnection;
using namespace std::chrono;

class HeartbeatSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<SyncEngineSettings>();
        settings->room_clock.heartbeat_interval_ms = 20;
        coordinator = std::make_unique<RoomClockCoordinator>(settings);
        scheduler = std::make_unique<HeartbeatScheduler>(coordinator.get(), settings);
    }

    void TearDown() override {
        scheduler->stop();
    }

    std::shared_ptr<RecordingRoomConnection> playing_room(const std::string& room, const std::string& conn_id) {
        auto conn = std::make_shared<RecordingRoomConnection>(conn_id, "alice");
        coordinator->join(room, conn);
        MediaItem item;
        item.id = "https://example.com/" + room;
        coordinator->mutate(room, PlaybackOp::set_item(item));
        return conn;
    }

    std::shared_ptr<SyncEngineSettings> settings;
    std::unique_ptr<RoomClockCoordinator> coordinator;
    std::unique_ptr<HeartbeatScheduler> scheduler;
};

TEST_F(HeartbeatSchedulerTest, StartStop) {
    EXPECT_FALSE(scheduler->is_running());
    scheduler->start();
    EXPECT_TRUE(scheduler->is_running());
    scheduler->stop();
    EXPECT_FALSE(scheduler->is_running());
}

TEST_F(HeartbeatSchedulerTest, AddRoomIsIdempotent) {
    scheduler->add_room("a");
    scheduler->add_room("a");
    scheduler->add_room("b");
    EXPECT_EQ(scheduler->scheduled_room_count(), 2u);
    scheduler->remove_room("a");
    scheduler->remove_room("missing");
    EXPECT_EQ(scheduler->scheduled_room_count(), 1u);
}

TEST_F(HeartbeatSchedulerTest, PlayingRoomsReceiveHeartbeats) {
    auto conn = playing_room("a", "c1");
    scheduler->add_room("a");
    scheduler->start();

    std::this_thread::sleep_for(milliseconds(150));
    scheduler->stop();

    const auto beats = conn->count_of(MessageType::Heartbeat);
    EXPECT_GE(beats, 2u);
    EXPECT_LE(beats, 10u);
}

TEST_F(HeartbeatSchedulerTest, PausedRoomIsSkipped) {
    auto conn = std::make_shared<RecordingRoomConnection>("c1", "alice");
    coordinator->join("paused", conn);
    scheduler->add_room("paused");
    scheduler->start();

    std::this_thread::sleep_for(milliseconds(100));
    scheduler->stop();
    EXPECT_EQ(conn->count_of(MessageType::Heartbeat), 0u);
}

TEST_F(HeartbeatSchedulerTest, RemovedRoomStopsBeating) {
    auto conn = playing_room("a", "c1");
    scheduler->add_room("a");
    scheduler->start();
    std::this_thread::sleep_for(milliseconds(80));
    scheduler->remove_room("a");
    std::this_thread::sleep_for(milliseconds(30));

    const auto beats = conn->count_of(MessageType::Heartbeat);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(conn->count_of(MessageType::Heartbeat), beats);
}

TEST_F(HeartbeatSchedulerTest, RoomsBeatIndependently) {
    auto first = playing_room("a", "c1");
    auto second = playing_room("b", "c2");
    scheduler->add_room("a");
    scheduler->start();
    std::this_thread::sleep_for(milliseconds(100));
    scheduler->add_room("b");
    std::this_thread::sleep_for(milliseconds(100));
    scheduler->stop();

    EXPECT_GT(first->count_of(MessageType::Heartbeat), second->count_of(MessageType::Heartbeat));
    EXPECT_GE(second->count_of(MessageType::Heartbeat), 1u);
}

TEST_F(HeartbeatSchedulerTest, LifecycleCallbacksDriveScheduling) {
    coordinator->set_room_lifecycle_callbacks(
        [this](const std::string& id) { scheduler->add_room(id); },
        [this](const std::string& id) { scheduler->remove_room(id); });

    coordinator->ensure_room("a", "alice");
    EXPECT_EQ(scheduler->scheduled_room_count(), 1u);
    coordinator->cleanup_stale_rooms(-1.0);
    EXPECT_EQ(scheduler->scheduled_room_count(), 0u);
}

class StaleRoomJanitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<SyncEngineSettings>();
        settings->room_clock.empty_room_ttl_sec = 0.0;
        settings->room_clock.cleanup_interval_ms = 20;
        coordinator = std::make_unique<RoomClockCoordinator>(settings);
    }

    std::shared_ptr<SyncEngineSettings> settings;
    std::unique_ptr<RoomClockCoordinator> coordinator;
};

TEST_F(StaleRoomJanitorTest, SweepRemovesEmptyRooms) {
    StaleRoomJanitor janitor(coordinator.get(), settings);
    coordinator->ensure_room("empty", "alice");
    auto conn = std::make_shared<RecordingRoomConnection>("c1", "bob");
    coordinator->join("busy", conn);

    std::this_thread::sleep_for(milliseconds(5));
    EXPECT_EQ(janitor.sweep(), 1u);
    EXPECT_EQ(coordinator->room_ids(), std::vector<std::string>{"busy"});
}

TEST_F(StaleRoomJanitorTest, BackgroundThreadSweeps) {
    StaleRoomJanitor janitor(coordinator.get(), settings);
    coordinator->ensure_room("empty", "alice");
    janitor.start();
    std::this_thread::sleep_for(milliseconds(150));
    janitor.stop();
    EXPECT_TRUE(coordinator->room_ids().empty());
}

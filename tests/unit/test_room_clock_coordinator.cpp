#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "room/room_clock_coordinator.h"
#include "mocks/mock_room_connection.h"

using namespace syncroom::engine;
using syncroom::engine::protocol::MessageType;
using syncroom::engine::testing::RecordingRoomConnection;
using namespace std::chrono;

class RoomClockCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<SyncEngineSettings>();
        clock_now = steady_clock::now();
        coordinator = std::make_unique<RoomClockCoordinator>(settings, [this]() { return clock_now; });
    }

    std::shared_ptr<RecordingRoomConnection> connect(const std::string& id, const std::string& identity,
                                                     const std::string& room = "movie-night") {
        auto conn = std::make_shared<RecordingRoomConnection>(id, identity);
        EXPECT_TRUE(coordinator->join(room, conn));
        return conn;
    }

    void advance_clock(double seconds) {
        clock_now += duration_cast<steady_clock::duration>(duration<double>(seconds));
    }

    static MediaItem item(const std::string& id, bool pinned = false) {
        MediaItem m;
        m.id = id;
        m.title = id;
        m.pinned = pinned;
        return m;
    }

    std::shared_ptr<SyncEngineSettings> settings;
    SteadyTime clock_now;
    std::unique_ptr<RoomClockCoordinator> coordinator;
};

TEST_F(RoomClockCoordinatorTest, CreatorBecomesAdmin) {
    EXPECT_TRUE(coordinator->ensure_room("movie-night", "alice"));
    EXPECT_FALSE(coordinator->ensure_room("movie-night", "bob"));

    auto snap = coordinator->snapshot("movie-night");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->roles.at("alice"), RoomRole::Admin);
    EXPECT_EQ(snap->roles.at("bob"), RoomRole::User);
}

TEST_F(RoomClockCoordinatorTest, JoinSendsSnapshotAndBroadcastsMembers) {
    auto alice = connect("c1", "alice");
    auto sync = alice->payloads_of(MessageType::Sync);
    ASSERT_EQ(sync.size(), 1u);
    EXPECT_EQ(sync[0]["your_identity"].asString(), "alice");
    EXPECT_EQ(sync[0]["your_role"].asString(), "admin");
    EXPECT_FALSE(sync[0]["is_playing"].asBool());

    auto bob = connect("c2", "bob");
    auto joined = alice->payloads_of(MessageType::UserJoined);
    ASSERT_EQ(joined.size(), 2u);
    EXPECT_EQ(joined[1]["identity"].asString(), "bob");
    EXPECT_EQ(joined[1]["members"].size(), 2u);
    EXPECT_EQ(bob->payloads_of(MessageType::Sync)[0]["your_role"].asString(), "user");
    EXPECT_EQ(bob->count_of(MessageType::UserJoined), 1u);
}

TEST_F(RoomClockCoordinatorTest, DuplicateJoinIsRejected) {
    auto alice = connect("c1", "alice");
    EXPECT_FALSE(coordinator->join("movie-night", alice));
    EXPECT_FALSE(coordinator->join("movie-night", nullptr));
}

TEST_F(RoomClockCoordinatorTest, MembersAreUniqueAcrossTabs) {
    connect("c1", "alice");
    connect("c2", "alice");
    auto snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->members.size(), 1u);
    EXPECT_EQ(snap->connection_count, 2u);
}

TEST_F(RoomClockCoordinatorTest, LeaveBroadcastsRemainingMembers) {
    auto alice = connect("c1", "alice");
    connect("c2", "bob");
    EXPECT_TRUE(coordinator->leave("movie-night", "c2"));
    auto left = alice->payloads_of(MessageType::UserLeft);
    ASSERT_EQ(left.size(), 1u);
    ASSERT_EQ(left[0]["members"].size(), 1u);
    EXPECT_EQ(left[0]["members"][0].asString(), "alice");
    EXPECT_FALSE(coordinator->leave("movie-night", "c2"));
}

TEST_F(RoomClockCoordinatorTest, PositionExtrapolatesWhilePlaying) {
    connect("c1", "alice");
    ASSERT_TRUE(coordinator->mutate("movie-night", PlaybackOp::set_item(item("https://example.com/a"))));
    ASSERT_TRUE(coordinator->mutate("movie-night", PlaybackOp::seek(100.0)));

    advance_clock(2.5);
    EXPECT_NEAR(coordinator->snapshot("movie-night")->position, 102.5, 1e-6);

    ASSERT_TRUE(coordinator->mutate("movie-night", PlaybackOp::pause(102.5)));
    advance_clock(10.0);
    EXPECT_NEAR(coordinator->snapshot("movie-night")->position, 102.5, 1e-6);
}

TEST_F(RoomClockCoordinatorTest, HeartbeatsNeverMoveMutationTime) {
    connect("c1", "alice");
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("https://example.com/a")));
    const SteadyTime anchor = coordinator->snapshot("movie-night")->last_mutation_time;

    for (int i = 0; i < 5; ++i) {
        advance_clock(5.0);
        EXPECT_TRUE(coordinator->heartbeat("movie-night"));
    }
    EXPECT_EQ(coordinator->snapshot("movie-night")->last_mutation_time, anchor);
    EXPECT_NEAR(coordinator->snapshot("movie-night")->position, 25.0, 1e-6);
}

TEST_F(RoomClockCoordinatorTest, RedundantCommandsDoNotMoveMutationTime) {
    connect("c1", "alice");
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("https://example.com/a")));
    advance_clock(3.0);
    const SteadyTime anchor = coordinator->snapshot("movie-night")->last_mutation_time;

    // Already playing at the extrapolated position.
    coordinator->mutate("movie-night", PlaybackOp::play(3.0));
    coordinator->mutate("movie-night", PlaybackOp::seek(3.005));
    EXPECT_EQ(coordinator->snapshot("movie-night")->last_mutation_time, anchor);

    coordinator->mutate("movie-night", PlaybackOp::seek(40.0));
    EXPECT_EQ(coordinator->snapshot("movie-night")->last_mutation_time, clock_now);

    advance_clock(1.0);
    coordinator->mutate("movie-night", PlaybackOp::pause(41.0));
    EXPECT_EQ(coordinator->snapshot("movie-night")->last_mutation_time, clock_now);
}

TEST_F(RoomClockCoordinatorTest, HeartbeatSkipsPausedAndEmptyRooms) {
    coordinator->ensure_room("empty", "alice");
    EXPECT_FALSE(coordinator->heartbeat("empty"));
    EXPECT_FALSE(coordinator->heartbeat("missing"));

    auto alice = connect("c1", "alice");
    EXPECT_FALSE(coordinator->heartbeat("movie-night"));

    coordinator->mutate("movie-night", PlaybackOp::set_item(item("https://example.com/a")));
    EXPECT_TRUE(coordinator->heartbeat("movie-night"));
    auto beats = alice->payloads_of(MessageType::Heartbeat);
    ASSERT_EQ(beats.size(), 1u);
    EXPECT_TRUE(beats[0]["is_playing"].asBool());
    EXPECT_TRUE(beats[0].isMember("server_time"));
}

TEST_F(RoomClockCoordinatorTest, OriginatorIsExcludedFromCommandBroadcast) {
    auto alice = connect("c1", "alice");
    auto bob = connect("c2", "bob");
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("https://example.com/a")), "c1");
    EXPECT_EQ(alice->count_of(MessageType::SetItem), 1u);
    EXPECT_EQ(bob->count_of(MessageType::SetItem), 1u);

    coordinator->mutate("movie-night", PlaybackOp::pause(12.0), "c1");
    EXPECT_EQ(alice->count_of(MessageType::Pause), 0u);
    auto pauses = bob->payloads_of(MessageType::Pause);
    ASSERT_EQ(pauses.size(), 1u);
    EXPECT_DOUBLE_EQ(pauses[0]["timestamp"].asDouble(), 12.0);
    EXPECT_FALSE(pauses[0]["is_live"].asBool());
}

TEST_F(RoomClockCoordinatorTest, OriginatorIncludedWhenExclusionDisabled) {
    settings->room_clock.exclude_originator_from_commands = false;
    auto alice = connect("c1", "alice");
    coordinator->mutate("movie-night", PlaybackOp::seek(5.0), "c1");
    EXPECT_EQ(alice->count_of(MessageType::Seek), 1u);
}

TEST_F(RoomClockCoordinatorTest, SetItemInsertsAtHeadAndPlays) {
    auto alice = connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));

    auto snap = coordinator->snapshot("movie-night");
    ASSERT_EQ(snap->queue.size(), 2u);
    EXPECT_EQ(snap->queue[0].id, "a");
    EXPECT_EQ(snap->playing_index, 0);
    EXPECT_TRUE(snap->is_playing);
    EXPECT_DOUBLE_EQ(snap->position, 0.0);

    auto set_items = alice->payloads_of(MessageType::SetItem);
    ASSERT_EQ(set_items.size(), 1u);
    EXPECT_EQ(set_items[0]["item"]["id"].asString(), "a");
    EXPECT_EQ(set_items[0]["queue"].size(), 2u);
}

TEST_F(RoomClockCoordinatorTest, AdvanceRemovesFinishedItem) {
    connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));

    ASSERT_TRUE(coordinator->advance("movie-night", "a"));
    auto snap = coordinator->snapshot("movie-night");
    ASSERT_EQ(snap->queue.size(), 1u);
    EXPECT_EQ(snap->current_item->id, "b");
    EXPECT_EQ(snap->playing_index, 0);
    EXPECT_TRUE(snap->is_playing);
}

TEST_F(RoomClockCoordinatorTest, DuplicateEndReportsAdvanceOnce) {
    connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->queue_add("movie-night", item("c"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));

    EXPECT_TRUE(coordinator->advance("movie-night", "a"));
    EXPECT_FALSE(coordinator->advance("movie-night", "a"));
    EXPECT_EQ(coordinator->snapshot("movie-night")->current_item->id, "b");
}

TEST_F(RoomClockCoordinatorTest, AdvanceKeepsPinnedItemsAndWraps) {
    connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b", true));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a", true)));

    coordinator->advance("movie-night", "a");
    auto snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->queue.size(), 2u);
    EXPECT_EQ(snap->current_item->id, "b");
    EXPECT_EQ(snap->playing_index, 1);

    coordinator->advance("movie-night", "b");
    snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->current_item->id, "a");
    EXPECT_EQ(snap->playing_index, 0);
}

TEST_F(RoomClockCoordinatorTest, AdvancePastLastItemStops) {
    connect("c1", "alice");
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));
    coordinator->advance("movie-night", "a");
    auto snap = coordinator->snapshot("movie-night");
    EXPECT_TRUE(snap->queue.empty());
    EXPECT_FALSE(snap->current_item.has_value());
    EXPECT_EQ(snap->playing_index, -1);
    EXPECT_FALSE(snap->is_playing);
}

TEST_F(RoomClockCoordinatorTest, QueueRemoveProtectsPlayingItem) {
    auto alice = connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->queue_add("movie-night", item("c"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));

    EXPECT_FALSE(coordinator->queue_remove("movie-night", 0));
    EXPECT_FALSE(coordinator->queue_remove("movie-night", 9));
    EXPECT_TRUE(coordinator->queue_remove("movie-night", 1));

    auto snap = coordinator->snapshot("movie-night");
    ASSERT_EQ(snap->queue.size(), 2u);
    EXPECT_EQ(snap->queue[1].id, "c");
    EXPECT_EQ(alice->count_of(MessageType::QueueUpdate), 3u);
}

TEST_F(RoomClockCoordinatorTest, QueueReorderTracksPlayingIndex) {
    connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->queue_add("movie-night", item("c"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));

    ASSERT_TRUE(coordinator->queue_reorder("movie-night", 0, 2));
    auto snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->queue[2].id, "a");
    EXPECT_EQ(snap->playing_index, 2);

    ASSERT_TRUE(coordinator->queue_reorder("movie-night", 0, 2));
    snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->queue[1].id, "a");
    EXPECT_EQ(snap->playing_index, 1);

    EXPECT_FALSE(coordinator->queue_reorder("movie-night", 0, 3));
}

TEST_F(RoomClockCoordinatorTest, QueuePinTogglesAndUpdatesCurrentItem) {
    connect("c1", "alice");
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));
    ASSERT_TRUE(coordinator->queue_toggle_pin("movie-night", 0));
    auto snap = coordinator->snapshot("movie-night");
    EXPECT_TRUE(snap->queue[0].pinned);
    EXPECT_TRUE(snap->current_item->pinned);
    ASSERT_TRUE(coordinator->queue_toggle_pin("movie-night", 0));
    EXPECT_FALSE(coordinator->snapshot("movie-night")->queue[0].pinned);
}

TEST_F(RoomClockCoordinatorTest, QueuePlayJumpsAndDropsUnpinnedCurrent) {
    auto alice = connect("c1", "alice");
    coordinator->queue_add("movie-night", item("b"));
    coordinator->queue_add("movie-night", item("c"));
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));
    advance_clock(30.0);

    ASSERT_TRUE(coordinator->queue_play("movie-night", 2));
    auto snap = coordinator->snapshot("movie-night");
    ASSERT_EQ(snap->queue.size(), 2u);
    EXPECT_EQ(snap->current_item->id, "c");
    EXPECT_EQ(snap->playing_index, 1);
    EXPECT_DOUBLE_EQ(snap->position, 0.0);
    EXPECT_EQ(alice->count_of(MessageType::SetItem), 2u);
}

TEST_F(RoomClockCoordinatorTest, OnlyAdminsPromote) {
    auto alice = connect("c1", "alice");
    connect("c2", "bob");

    EXPECT_FALSE(coordinator->promote("movie-night", "bob", "bob", RoomRole::Admin));
    EXPECT_TRUE(coordinator->promote("movie-night", "alice", "bob", RoomRole::Moderator));
    EXPECT_EQ(coordinator->snapshot("movie-night")->roles.at("bob"), RoomRole::Moderator);

    auto updates = alice->payloads_of(MessageType::RolesUpdate);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0]["roles"]["bob"].asString(), "moderator");
}

TEST_F(RoomClockCoordinatorTest, OnlyAdminsTogglePermanent) {
    auto alice = connect("c1", "alice");
    connect("c2", "bob");
    EXPECT_FALSE(coordinator->toggle_permanent("movie-night", "bob"));
    EXPECT_TRUE(coordinator->toggle_permanent("movie-night", "alice"));
    EXPECT_TRUE(coordinator->snapshot("movie-night")->permanent);
    auto updates = alice->payloads_of(MessageType::RoomSettingsUpdate);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_TRUE(updates[0]["permanent"].asBool());
}

TEST_F(RoomClockCoordinatorTest, FailedSendRemovesConnectionAndContinues) {
    auto alice = connect("c1", "alice");
    auto bob = connect("c2", "bob");
    auto carol = connect("c3", "carol");
    bob->set_fail_sends(true);

    EXPECT_TRUE(coordinator->mutate("movie-night", PlaybackOp::seek(50.0)));
    EXPECT_EQ(alice->count_of(MessageType::Seek), 1u);
    EXPECT_EQ(carol->count_of(MessageType::Seek), 1u);
    EXPECT_EQ(bob->close_calls(), 1);

    auto snap = coordinator->snapshot("movie-night");
    EXPECT_EQ(snap->connection_count, 2u);
    auto left = carol->payloads_of(MessageType::UserLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0]["members"].size(), 2u);
    EXPECT_EQ(coordinator->stats().dead_connections_removed, 1u);
}

TEST_F(RoomClockCoordinatorTest, ThrowingSendIsTreatedAsDead) {
    connect("c1", "alice");
    auto bob = connect("c2", "bob");
    bob->set_throw_on_send(true);
    coordinator->mutate("movie-night", PlaybackOp::set_item(item("a")));
    EXPECT_TRUE(coordinator->heartbeat("movie-night"));
    EXPECT_EQ(coordinator->snapshot("movie-night")->connection_count, 1u);
}

TEST_F(RoomClockCoordinatorTest, CleanupRemovesOnlyStaleEmptyRooms) {
    std::vector<std::string> removed_callbacks;
    coordinator->set_room_lifecycle_callbacks(nullptr, [&](const std::string& id) { removed_callbacks.push_back(id); });

    coordinator->ensure_room("stale", "alice");
    coordinator->ensure_room("kept", "alice");
    coordinator->toggle_permanent("kept", "alice");
    connect("c1", "bob", "busy");

    advance_clock(301.0);
    auto removed = coordinator->cleanup_stale_rooms(300.0);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "stale");
    EXPECT_EQ(removed_callbacks, removed);
    EXPECT_FALSE(coordinator->snapshot("stale").has_value());
    EXPECT_TRUE(coordinator->snapshot("kept").has_value());
    EXPECT_TRUE(coordinator->snapshot("busy").has_value());
}

TEST_F(RoomClockCoordinatorTest, CleanupWaitsForGracePeriodAfterLastLeave) {
    connect("c1", "alice");
    advance_clock(1000.0);
    coordinator->leave("movie-night", "c1");

    advance_clock(100.0);
    EXPECT_TRUE(coordinator->cleanup_stale_rooms(300.0).empty());
    advance_clock(201.0);
    EXPECT_EQ(coordinator->cleanup_stale_rooms(300.0).size(), 1u);
}

TEST_F(RoomClockCoordinatorTest, UnknownRoomOperationsFail) {
    EXPECT_FALSE(coordinator->mutate("missing", PlaybackOp::play(0.0)));
    EXPECT_FALSE(coordinator->advance("missing"));
    EXPECT_FALSE(coordinator->queue_add("missing", item("a")));
    EXPECT_FALSE(coordinator->snapshot("missing").has_value());
}

class RoomClockCoordinatorConcurrencyTest : public ::testing::Test {
protected:
    std::shared_ptr<SyncEngineSettings> settings = std::make_shared<SyncEngineSettings>();
};

TEST_F(RoomClockCoordinatorConcurrencyTest, ConcurrentFirstJoinsYieldOneAdmin) {
    for (int round = 0; round < 20; ++round) {
        RoomClockCoordinator coordinator(settings);
        constexpr int kJoiners = 8;
        std::atomic<bool> go{false};
        std::vector<std::thread> threads;
        std::vector<std::shared_ptr<RecordingRoomConnection>> conns;
        for (int i = 0; i < kJoiners; ++i) {
            conns.push_back(std::make_shared<RecordingRoomConnection>("c" + std::to_string(i), "user" + std::to_string(i)));
        }
        for (int i = 0; i < kJoiners; ++i) {
            threads.emplace_back([&, i]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                coordinator.join("race", conns[i]);
            });
        }
        go = true;
        for (auto& t : threads) {
            t.join();
        }

        auto snap = coordinator.snapshot("race");
        ASSERT_TRUE(snap.has_value());
        int admins = 0;
        for (const auto& [identity, role] : snap->roles) {
            if (role == RoomRole::Admin) admins++;
        }
        EXPECT_EQ(admins, 1) << "round " << round;
        EXPECT_EQ(snap->connection_count, static_cast<std::size_t>(kJoiners));
    }
}

TEST_F(RoomClockCoordinatorConcurrencyTest, CommandsArriveInMutationOrder) {
    RoomClockCoordinator coordinator(settings);
    auto watcher = std::make_shared<RecordingRoomConnection>("w", "watcher");
    coordinator.join("order", watcher);
    watcher->clear();

    constexpr int kWriters = 4;
    constexpr int kOps = 50;
    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w]() {
            for (int i = 0; i < kOps; ++i) {
                coordinator.mutate("order", PlaybackOp::seek(1000.0 * w + i + 1));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto seeks = watcher->payloads_of(MessageType::Seek);
    ASSERT_EQ(seeks.size(), static_cast<std::size_t>(kWriters * kOps));
    EXPECT_DOUBLE_EQ(seeks.back()["timestamp"].asDouble(), coordinator.snapshot("order")->position);
}

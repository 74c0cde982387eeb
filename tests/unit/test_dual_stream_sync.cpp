#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "client/dual_stream_sync.h"
#include "mocks/mock_media_element.h"

using namespace syncroom::engine;
using syncroom::engine::testing::FakeMediaElement;
using namespace std::chrono;

class DualStreamSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary = std::make_shared<FakeMediaElement>();
        secondary = std::make_shared<FakeMediaElement>();
        sync = std::make_shared<DualStreamSync>(tuning);
        sync->set_notice_callback([this](const std::string& msg) { notices.push_back(msg); });
        ASSERT_TRUE(sync->attach(primary, secondary));
        now = steady_clock::now();
    }

    void start_playing(double at) {
        primary->set_time(at);
        sync->play();
        ASSERT_FALSE(primary->paused());
        ASSERT_FALSE(secondary->paused());
    }

    void step(milliseconds dt) {
        now += dt;
        sync->tick(now);
    }

    DualStreamTuning tuning;
    std::shared_ptr<FakeMediaElement> primary;
    std::shared_ptr<FakeMediaElement> secondary;
    std::shared_ptr<DualStreamSync> sync;
    std::vector<std::string> notices;
    SteadyTime now;
};

TEST_F(DualStreamSyncTest, AttachMutesPrimaryOnly) {
    EXPECT_TRUE(primary->muted());
    EXPECT_FALSE(secondary->muted());
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Good);
}

TEST_F(DualStreamSyncTest, AttachRejectsMissingElement) {
    auto other = std::make_shared<DualStreamSync>(tuning);
    EXPECT_FALSE(other->attach(primary, nullptr));
    EXPECT_FALSE(other->attached());
}

TEST_F(DualStreamSyncTest, PlayAlignsAndStartsBothElements) {
    secondary->set_time(3.0);
    start_playing(10.0);
    EXPECT_DOUBLE_EQ(secondary->current_time(), 10.0);
    EXPECT_TRUE(sync->is_playing());
}

TEST_F(DualStreamSyncTest, SmallDriftKeepsNormalRate) {
    start_playing(10.0);
    secondary->set_time(10.1);
    step(milliseconds(250));
    EXPECT_DOUBLE_EQ(secondary->playback_rate(), 1.0);
    EXPECT_NEAR(sync->state().last_drift, 0.1, 1e-9);
}

TEST_F(DualStreamSyncTest, ModerateDriftNudgesSecondaryRate) {
    start_playing(10.0);
    secondary->set_time(10.3);
    step(milliseconds(250));
    EXPECT_DOUBLE_EQ(secondary->playback_rate(), 0.97);

    secondary->set_time(9.7);
    step(milliseconds(250));
    EXPECT_DOUBLE_EQ(secondary->playback_rate(), 1.03);
    EXPECT_FALSE(sync->state().is_syncing);
}

TEST_F(DualStreamSyncTest, LowSecondaryBufferPausesSecondaryRegardlessOfDrift) {
    start_playing(10.0);
    secondary->set_time(11.0);  // Would otherwise trigger a heavy resync.
    secondary->set_buffered({TimeRange{0.0, 11.1}});

    step(milliseconds(250));
    EXPECT_TRUE(secondary->paused());
    EXPECT_TRUE(sync->state().is_buffering);
    EXPECT_FALSE(sync->state().is_syncing);
    EXPECT_FALSE(primary->paused());
}

TEST_F(DualStreamSyncTest, BufferRecoveryRealignsAndResumes) {
    start_playing(10.0);
    secondary->set_buffered({TimeRange{0.0, 10.1}});
    step(milliseconds(250));
    ASSERT_TRUE(secondary->paused());

    primary->set_time(12.0);
    secondary->set_buffer_ahead(20.0);
    step(milliseconds(250));
    EXPECT_FALSE(sync->state().is_buffering);
    EXPECT_FALSE(secondary->paused());
    EXPECT_DOUBLE_EQ(secondary->current_time(), 12.0);
}

TEST_F(DualStreamSyncTest, NearEndOfMediaIsNotStarvation) {
    primary->set_duration(100.0);
    start_playing(99.9);
    primary->set_buffered({TimeRange{0.0, 100.0}});
    secondary->set_buffered({TimeRange{0.0, 100.0}});
    step(milliseconds(250));
    EXPECT_FALSE(sync->state().is_buffering);
    EXPECT_FALSE(secondary->paused());
}

TEST_F(DualStreamSyncTest, HeavyDriftRunsResyncAndRecovers) {
    start_playing(20.0);
    secondary->set_time(21.0);

    step(milliseconds(250));
    EXPECT_TRUE(sync->state().is_syncing);
    EXPECT_TRUE(primary->paused());
    EXPECT_TRUE(secondary->paused());
    EXPECT_DOUBLE_EQ(secondary->current_time(), 20.0);
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Recovering);

    step(milliseconds(250));
    EXPECT_FALSE(sync->state().is_syncing);
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Good);
    EXPECT_EQ(sync->state().consecutive_failures, 0);
    EXPECT_FALSE(primary->paused());
    EXPECT_FALSE(secondary->paused());
}

TEST_F(DualStreamSyncTest, HeavyResyncRespectsCooldown) {
    start_playing(20.0);
    secondary->set_time(21.0);
    step(milliseconds(250));
    step(milliseconds(250));
    ASSERT_FALSE(sync->state().is_syncing);

    // Within the 2 s cooldown: light correction only.
    secondary->set_time(primary->current_time() + 1.0);
    step(milliseconds(500));
    EXPECT_FALSE(sync->state().is_syncing);
    EXPECT_DOUBLE_EQ(secondary->playback_rate(), 0.97);

    step(milliseconds(2000));
    EXPECT_TRUE(sync->state().is_syncing);
}

TEST_F(DualStreamSyncTest, TimeoutCountsFailureAndForcesResume) {
    start_playing(20.0);
    primary->set_ready_state(2);
    secondary->set_time(21.0);
    step(milliseconds(250));
    ASSERT_TRUE(sync->state().is_syncing);

    step(milliseconds(2000));
    EXPECT_TRUE(sync->state().is_syncing);

    step(milliseconds(1001));
    EXPECT_FALSE(sync->state().is_syncing);
    EXPECT_EQ(sync->state().consecutive_failures, 1);
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Recovering);
    EXPECT_EQ(sync->heavy_sync_cooldown(), milliseconds(4000));
    EXPECT_FALSE(primary->paused());
    EXPECT_FALSE(secondary->paused());
}

TEST_F(DualStreamSyncTest, RejectedPrimaryPlayAfterResyncIsRetried) {
    start_playing(20.0);
    primary->set_ready_state(2);
    secondary->set_time(21.0);
    step(milliseconds(250));
    ASSERT_TRUE(sync->state().is_syncing);

    primary->script_play_results({PlayResult::Failed, PlayResult::Failed});
    step(milliseconds(3001));
    ASSERT_FALSE(sync->state().is_syncing);
    EXPECT_TRUE(primary->paused());
    EXPECT_FALSE(secondary->paused());
    EXPECT_EQ(primary->play_calls, 2);

    step(milliseconds(50));
    EXPECT_EQ(primary->play_calls, 2);

    step(milliseconds(60));
    EXPECT_EQ(primary->play_calls, 3);
    EXPECT_TRUE(primary->paused());

    step(milliseconds(100));
    EXPECT_EQ(primary->play_calls, 4);
    EXPECT_FALSE(primary->paused());
    EXPECT_FALSE(secondary->paused());
    EXPECT_TRUE(notices.empty());
}

TEST_F(DualStreamSyncTest, PrimaryRetriesAreCappedUntilPlayIsRequested) {
    start_playing(20.0);
    primary->set_ready_state(2);
    primary->set_default_play_result(PlayResult::Failed);
    secondary->set_time(21.0);
    step(milliseconds(250));
    step(milliseconds(3001));
    ASSERT_TRUE(primary->paused());
    const int after_resync = primary->play_calls;

    for (int i = 0; i < 10; ++i) {
        step(milliseconds(250));
    }
    EXPECT_EQ(primary->play_calls, after_resync + tuning.max_recovery_attempts);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0], "Playback could not be resumed. Press play to try again.");
    EXPECT_TRUE(sync->is_playing());

    primary->set_default_play_result(PlayResult::Started);
    sync->play();
    EXPECT_FALSE(primary->paused());
}

TEST_F(DualStreamSyncTest, FiveFailuresEndInFailedStateWithPlaybackRunning) {
    start_playing(20.0);
    primary->set_ready_state(2);

    for (int i = 0; i < tuning.max_consecutive_failures; ++i) {
        secondary->set_time(primary->current_time() + 1.0);
        step(milliseconds(60000));
        ASSERT_TRUE(sync->state().is_syncing) << "attempt " << i;
        step(milliseconds(3001));
        ASSERT_FALSE(sync->state().is_syncing);
    }

    EXPECT_EQ(sync->state().sync_health, SyncHealth::Failed);
    EXPECT_EQ(sync->state().consecutive_failures, 5);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_FALSE(primary->paused());
    EXPECT_FALSE(secondary->paused());

    secondary->set_time(primary->current_time() + 1.0);
    step(milliseconds(60000));
    EXPECT_FALSE(sync->state().is_syncing);
    EXPECT_FALSE(primary->paused());
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Failed);
}

TEST_F(DualStreamSyncTest, AttachResetsFailedState) {
    start_playing(20.0);
    primary->set_ready_state(2);
    for (int i = 0; i < tuning.max_consecutive_failures; ++i) {
        secondary->set_time(primary->current_time() + 1.0);
        step(milliseconds(60000));
        step(milliseconds(3001));
    }
    ASSERT_EQ(sync->state().sync_health, SyncHealth::Failed);

    const auto generation = sync->generation();
    ASSERT_TRUE(sync->attach(std::make_shared<FakeMediaElement>(), std::make_shared<FakeMediaElement>()));
    EXPECT_GT(sync->generation(), generation);
    EXPECT_EQ(sync->state().sync_health, SyncHealth::Good);
    EXPECT_EQ(sync->state().consecutive_failures, 0);
}

TEST_F(DualStreamSyncTest, StalePlayCallbacksAreIgnoredAfterAttach) {
    primary->set_deferred(true);
    primary->set_time(5.0);
    sync->play();
    ASSERT_EQ(primary->pending_play_count(), 1u);

    auto old_secondary = secondary;
    ASSERT_TRUE(sync->attach(std::make_shared<FakeMediaElement>(), std::make_shared<FakeMediaElement>()));
    primary->resolve_pending(PlayResult::Started);
    EXPECT_EQ(old_secondary->play_calls, 0);
}

TEST_F(DualStreamSyncTest, PassiveRecoveryIsSpacedAndCapped) {
    start_playing(10.0);
    secondary->script_play_results({PlayResult::Failed, PlayResult::Failed, PlayResult::Failed, PlayResult::Failed});
    secondary->set_paused(true);
    const int baseline = secondary->play_calls;

    step(milliseconds(250));
    EXPECT_EQ(secondary->play_calls, baseline + 1);
    step(milliseconds(50));
    EXPECT_EQ(secondary->play_calls, baseline + 1);
    step(milliseconds(100));
    step(milliseconds(100));
    step(milliseconds(100));
    step(milliseconds(100));
    EXPECT_EQ(secondary->play_calls, baseline + 3);
    EXPECT_EQ(sync->state().recovery_attempts, 3);
}

TEST_F(DualStreamSyncTest, PassiveRecoveryWaitsForReadyState) {
    start_playing(10.0);
    secondary->set_paused(true);
    secondary->set_ready_state(1);
    const int baseline = secondary->play_calls;
    step(milliseconds(250));
    EXPECT_EQ(secondary->play_calls, baseline);

    secondary->set_ready_state(2);
    step(milliseconds(250));
    EXPECT_EQ(secondary->play_calls, baseline + 1);
    EXPECT_FALSE(secondary->paused());
}

TEST_F(DualStreamSyncTest, SecondaryAutoplayRejectionFallsBackToMuted) {
    secondary->script_play_results({PlayResult::NotAllowed});
    primary->set_time(3.0);
    sync->play();
    EXPECT_TRUE(secondary->muted());
    EXPECT_TRUE(sync->state().muted);
    EXPECT_FALSE(secondary->paused());
    EXPECT_EQ(notices.size(), 1u);
}

TEST_F(DualStreamSyncTest, PauseStopsBoth) {
    start_playing(10.0);
    sync->pause();
    EXPECT_TRUE(primary->paused());
    EXPECT_TRUE(secondary->paused());
    EXPECT_FALSE(sync->is_playing());
}

TEST_F(DualStreamSyncTest, SeekMovesBoth) {
    sync->seek(42.0);
    EXPECT_DOUBLE_EQ(primary->current_time(), 42.0);
    EXPECT_DOUBLE_EQ(secondary->current_time(), 42.0);
}

TEST_F(DualStreamSyncTest, VolumeAndMuteApplyToSecondary) {
    sync->set_volume(1.7);
    EXPECT_DOUBLE_EQ(secondary->volume(), 1.0);
    sync->set_volume(0.25);
    EXPECT_DOUBLE_EQ(secondary->volume(), 0.25);
    sync->set_muted(true);
    EXPECT_TRUE(secondary->muted());
    EXPECT_TRUE(primary->muted());
}

TEST_F(DualStreamSyncTest, BaseRateScalesLightCorrection) {
    start_playing(10.0);
    sync->set_playback_rate(1.05);
    EXPECT_DOUBLE_EQ(primary->playback_rate(), 1.05);
    secondary->set_time(10.3);
    step(milliseconds(250));
    EXPECT_NEAR(secondary->playback_rate(), 1.05 * 0.97, 1e-12);
}

TEST_F(DualStreamSyncTest, VisibilityChangeResetsRateAndResumesSecondary) {
    start_playing(10.0);
    secondary->set_time(10.3);
    step(milliseconds(250));
    ASSERT_DOUBLE_EQ(secondary->playback_rate(), 0.97);

    sync->on_visibility_changed(false);
    EXPECT_DOUBLE_EQ(secondary->playback_rate(), 1.0);

    secondary->set_paused(true);
    primary->set_time(15.0);
    sync->on_visibility_changed(true);
    EXPECT_FALSE(secondary->paused());
    EXPECT_DOUBLE_EQ(secondary->current_time(), 15.0);
}

TEST_F(DualStreamSyncTest, HiddenPrimaryPauseIsResumedAfterRetrySpacing) {
    start_playing(10.0);
    sync->on_visibility_changed(false);

    primary->set_paused(true);
    sync->on_primary_event(PrimaryEvent::Pause, now);
    EXPECT_TRUE(sync->is_playing());

    step(milliseconds(50));
    EXPECT_TRUE(primary->paused());
    step(milliseconds(60));
    EXPECT_FALSE(primary->paused());
}

TEST_F(DualStreamSyncTest, VisiblePrimaryPauseStopsSecondary) {
    start_playing(10.0);
    primary->set_paused(true);
    sync->on_primary_event(PrimaryEvent::Pause, now);
    EXPECT_TRUE(secondary->paused());
    EXPECT_FALSE(sync->is_playing());
}

TEST_F(DualStreamSyncTest, PrimaryWaitingAndCanPlayGateSecondary) {
    start_playing(10.0);
    sync->on_primary_event(PrimaryEvent::Waiting, now);
    EXPECT_TRUE(secondary->paused());
    EXPECT_TRUE(sync->state().is_buffering);

    primary->set_time(10.5);
    sync->on_primary_event(PrimaryEvent::CanPlay, now);
    EXPECT_FALSE(sync->state().is_buffering);
    EXPECT_FALSE(secondary->paused());
    EXPECT_DOUBLE_EQ(secondary->current_time(), 10.5);
}

TEST_F(DualStreamSyncTest, PrimarySeekRealignsSecondary) {
    start_playing(10.0);
    sync->on_primary_event(PrimaryEvent::Seeking, now);
    EXPECT_TRUE(secondary->paused());

    primary->set_time(55.0);
    sync->on_primary_event(PrimaryEvent::Seeked, now);
    EXPECT_DOUBLE_EQ(secondary->current_time(), 55.0);
    EXPECT_FALSE(secondary->paused());
}

TEST_F(DualStreamSyncTest, PrimaryEndedStops) {
    start_playing(10.0);
    sync->on_primary_event(PrimaryEvent::Ended, now);
    EXPECT_FALSE(sync->is_playing());
    EXPECT_TRUE(secondary->paused());
}

TEST(DualStreamSyncCooldownTest, ExponentIsBoundedWhateverTheSettings) {
    DualStreamTuning tuning;
    tuning.heavy_sync_cooldown_max_exponent = 1000;
    tuning.max_consecutive_failures = 40;
    auto primary = std::make_shared<FakeMediaElement>();
    auto secondary = std::make_shared<FakeMediaElement>();
    auto sync = std::make_shared<DualStreamSync>(tuning);
    ASSERT_TRUE(sync->attach(primary, secondary));

    primary->set_time(20.0);
    primary->set_ready_state(2);
    sync->play();
    SteadyTime now = steady_clock::now();
    for (int i = 0; i < 20; ++i) {
        secondary->set_time(primary->current_time() + 1.0);
        now += hours(1);
        sync->tick(now);
        ASSERT_TRUE(sync->state().is_syncing) << "attempt " << i;
        now += milliseconds(3001);
        sync->tick(now);
    }

    EXPECT_EQ(sync->state().consecutive_failures, 20);
    EXPECT_EQ(sync->heavy_sync_cooldown(),
              milliseconds(tuning.heavy_sync_cooldown_base_ms << DualStreamSync::kMaxCooldownExponent));
}

/**
 * @file dual_stream_sync.h
 * @brief Keeps a separate audio element aligned with a video element.
 * @details Dual-stream media is played by two elements: the primary (video only, always muted)
 *          and the secondary (audio only). The primary is the reference clock. On every tick the
 *          sub-engine:
 *          1. Pauses the secondary while either element is about to run out of buffered data, and
 *             re-aligns and resumes it when both have recovered.
 *          2. Resumes a secondary that stopped on its own (passive recovery).
 *          3. Measures `drift = secondary - primary` and corrects it, lightly through the
 *             secondary's playback rate or, past the heavy threshold, with a heavy resync.
 *
 *          A heavy resync is an explicit state machine: Idle -> Syncing -> Idle. While Syncing,
 *          both elements are paused and sought to the primary's time, and the sub-engine waits for
 *          both to become ready. A timeout counts as a failure. After `max_consecutive_failures`
 *          failures the health becomes `failed` and no further heavy resync is attempted until new
 *          media is attached. Successive attempts are spaced by an exponential cooldown. Whatever
 *          the outcome, both elements are resumed if playback was intended; a primary whose play is
 *          rejected is retried on later ticks, spaced and capped like passive recovery.
 *
 *          All calls, including element play callbacks, happen on the client loop thread.
 *          Callbacks from media attached before the latest `attach` are ignored.
 */
#ifndef DUAL_STREAM_SYNC_H
#define DUAL_STREAM_SYNC_H

#include "playback_target.h"
#include "serialized_media_element.h"
#include "../configuration/sync_engine_settings.h"
#include "../sync_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace syncroom {
namespace engine {

/** @brief Events raised by the primary element that the sub-engine reacts to. */
enum class PrimaryEvent {
    Waiting,
    CanPlay,
    Seeking,
    Seeked,
    Ended,
    Play,
    Pause
};

/**
 * @struct DualStreamState
 * @brief Observable state of the sub-engine.
 */
struct DualStreamState {
    bool is_playing = false;        ///< Intended play state.
    bool is_buffering = false;      ///< Secondary held because buffered data ran low.
    bool is_syncing = false;        ///< A heavy resync is in flight.
    double last_drift = 0.0;        ///< secondary - primary at the last drift check.
    SyncHealth sync_health = SyncHealth::Good;
    int consecutive_failures = 0;
    std::optional<SteadyTime> last_heavy_sync_time;
    int recovery_attempts = 0;      ///< Passive recovery attempts since the secondary last played.
    double current_time = 0.0;
    double duration = 0.0;
    double volume = 1.0;
    bool muted = false;
    bool visible = true;
};

class DualStreamSync : public IPlaybackTarget,
                       public std::enable_shared_from_this<DualStreamSync> {
public:
    using NoticeCallback = std::function<void(const std::string&)>;

    explicit DualStreamSync(const DualStreamTuning& tuning);

    /**
     * @brief Attaches new media. Resets health and failure count and invalidates callbacks from
     *        previously attached media.
     * @return false if either element is null.
     */
    bool attach(std::shared_ptr<IMediaElement> primary, std::shared_ptr<IMediaElement> secondary);
    void detach();
    bool attached() const { return primary_ && secondary_; }

    void set_notice_callback(NoticeCallback callback) { notice_callback_ = std::move(callback); }

    /** @brief Runs one monitoring pass. Called at `sync_frequency_hz`. */
    void tick(SteadyTime now);

    /**
     * @brief Handles the page becoming visible or hidden.
     * @details Resets the secondary's rate to the base rate, i.e. the primary rate set by drift
     *          correction, not to 1.0. When visible again with the primary playing and the
     *          secondary paused, the secondary is re-aligned and resumed.
     */
    void on_visibility_changed(bool visible);
    void on_primary_event(PrimaryEvent event, SteadyTime now);

    // --- IPlaybackTarget ---
    double current_time() const override;
    bool is_playing() const override { return state_.is_playing; }
    void seek(double position) override;
    void play() override;
    void pause() override;
    double playback_rate() const override { return base_rate_; }
    /** @brief Sets the base rate of both elements. Light corrections scale the secondary's rate. */
    void set_playback_rate(double rate) override;

    void set_volume(double volume);
    void set_muted(bool muted);

    const DualStreamState& state() const { return state_; }
    uint64_t generation() const { return generation_; }
    /** @brief Current heavy-resync cooldown. The exponent is capped at `kMaxCooldownExponent`. */
    std::chrono::milliseconds heavy_sync_cooldown() const;

    static constexpr int kMaxCooldownExponent = 16;

    IMediaElement* primary() const { return primary_.get(); }
    IMediaElement* secondary() const { return secondary_.get(); }

private:
    enum class ResyncPhase {
        Idle,
        Syncing
    };

    struct HeavyResync {
        ResyncPhase phase = ResyncPhase::Idle;
        SteadyTime started_at{};
        bool was_playing = false;
        uint64_t generation = 0;
    };

    bool monitor_buffers();
    void attempt_passive_recovery(SteadyTime now);
    void correct_drift(SteadyTime now);
    void resume_stalled_primary(SteadyTime now);

    bool start_heavy_resync(SteadyTime now, double drift);
    void advance_heavy_resync(SteadyTime now);
    void finish_heavy_resync(SteadyTime now, bool resume);

    void align_secondary();
    void play_primary();
    void play_secondary();
    void on_primary_play_result(PlayResult result);
    void on_secondary_play_result(PlayResult result, bool muted_retry);
    void set_secondary_rate(double rate);
    void raise_notice(const std::string& message);

    DualStreamTuning tuning_;
    std::shared_ptr<SerializedMediaElement> primary_;
    std::shared_ptr<SerializedMediaElement> secondary_;
    DualStreamState state_;
    HeavyResync resync_;
    double base_rate_ = 1.0;
    uint64_t generation_ = 0;
    std::optional<SteadyTime> last_recovery_attempt_;
    std::optional<SteadyTime> pending_primary_resume_;
    int primary_resume_attempts_ = 0;   ///< Play retries since the primary stalled while playing.
    std::optional<SteadyTime> last_primary_resume_attempt_;
    bool pending_stall_notice_ = false;
    NoticeCallback notice_callback_;
};

} // namespace engine
} // namespace syncroom

#endif // DUAL_STREAM_SYNC_H

#pragma once
/**
 * Fake media element for the client-side engines.
 * Playback only advances when the test calls advance(). play() resolves immediately with the
 * next scripted result, or is held until resolve_pending() when deferred mode is on.
 */

#include "client/media_element.h"

#include <deque>
#include <vector>

namespace syncroom {
namespace engine {
namespace testing {

class FakeMediaElement : public IMediaElement {
public:
    double current_time() const override { return current_time_; }
    void set_current_time(double seconds) override {
        current_time_ = seconds;
        seek_calls++;
    }
    double duration() const override { return duration_; }
    bool paused() const override { return paused_; }
    bool seeking() const override { return seeking_; }
    int ready_state() const override { return ready_state_; }

    std::vector<TimeRange> buffered() const override {
        if (!explicit_ranges_.empty()) {
            return explicit_ranges_;
        }
        return {TimeRange{0.0, current_time_ + buffer_ahead_}};
    }

    double playback_rate() const override { return rate_; }
    void set_playback_rate(double rate) override {
        rate_ = rate;
        rate_calls++;
    }

    void play(PlayCallback done) override {
        play_calls++;
        if (deferred_) {
            pending_.push_back(std::move(done));
            return;
        }
        settle(std::move(done), next_result());
    }

    void pause() override {
        pause_calls++;
        paused_ = true;
    }

    bool muted() const override { return muted_; }
    void set_muted(bool muted) override { muted_ = muted; }
    double volume() const override { return volume_; }
    void set_volume(double volume) override { volume_ = volume; }

    // Test control
    void advance(double seconds) {
        if (!paused_) {
            current_time_ += seconds * rate_;
        }
    }
    void set_time(double seconds) { current_time_ = seconds; }
    void set_duration(double seconds) { duration_ = seconds; }
    void set_paused(bool paused) { paused_ = paused; }
    void set_seeking(bool seeking) { seeking_ = seeking; }
    void set_ready_state(int state) { ready_state_ = state; }
    void set_buffer_ahead(double seconds) {
        explicit_ranges_.clear();
        buffer_ahead_ = seconds;
    }
    void set_buffered(std::vector<TimeRange> ranges) { explicit_ranges_ = std::move(ranges); }
    void script_play_results(std::deque<PlayResult> results) { scripted_ = std::move(results); }
    void set_default_play_result(PlayResult result) { default_result_ = result; }
    void set_deferred(bool deferred) { deferred_ = deferred; }

    std::size_t pending_play_count() const { return pending_.size(); }

    /** Settles the oldest held play() with `result`. */
    bool resolve_pending(PlayResult result) {
        if (pending_.empty()) {
            return false;
        }
        PlayCallback done = std::move(pending_.front());
        pending_.pop_front();
        settle(std::move(done), result);
        return true;
    }

    int play_calls = 0;
    int pause_calls = 0;
    int seek_calls = 0;
    int rate_calls = 0;

private:
    PlayResult next_result() {
        if (scripted_.empty()) {
            return default_result_;
        }
        PlayResult result = scripted_.front();
        scripted_.pop_front();
        return result;
    }

    void settle(PlayCallback done, PlayResult result) {
        if (result == PlayResult::Started) {
            paused_ = false;
        }
        if (done) {
            done(result);
        }
    }

    double current_time_ = 0.0;
    double duration_ = 600.0;
    bool paused_ = true;
    bool seeking_ = false;
    int ready_state_ = 4;
    double buffer_ahead_ = 30.0;
    std::vector<TimeRange> explicit_ranges_;
    double rate_ = 1.0;
    bool muted_ = false;
    double volume_ = 1.0;
    bool deferred_ = false;
    PlayResult default_result_ = PlayResult::Started;
    std::deque<PlayResult> scripted_;
    std::deque<PlayCallback> pending_;
};

} // namespace testing
} // namespace engine
} // namespace syncroom

/**
 * @file serialized_media_element.h
 * @brief Wraps an IMediaElement so play and pause requests never interleave.
 * @details A media element rejects a play that is interrupted by a pause with an abort error, and
 *          a pause issued while a play is pending is lost when the play resolves. This wrapper
 *          serializes both:
 *          - A play while another is pending joins it and receives the same outcome.
 *          - A pause while a play is pending is deferred until that play settles.
 *          - A play issued after a deferred pause cancels the pause.
 *          Every other member forwards to the wrapped element.
 *
 *          Not thread-safe. Used from the client loop thread only.
 */
#ifndef SERIALIZED_MEDIA_ELEMENT_H
#define SERIALIZED_MEDIA_ELEMENT_H

#include "media_element.h"

#include <memory>
#include <vector>

namespace syncroom {
namespace engine {

class SerializedMediaElement : public IMediaElement,
                               public std::enable_shared_from_this<SerializedMediaElement> {
public:
    /** @brief Wraps `inner`. Returns `inner` unchanged if it is already serialized. */
    static std::shared_ptr<SerializedMediaElement> wrap(std::shared_ptr<IMediaElement> inner);

    explicit SerializedMediaElement(std::shared_ptr<IMediaElement> inner);

    double current_time() const override { return inner_->current_time(); }
    void set_current_time(double seconds) override { inner_->set_current_time(seconds); }
    double duration() const override { return inner_->duration(); }
    bool paused() const override { return inner_->paused(); }
    bool seeking() const override { return inner_->seeking(); }
    int ready_state() const override { return inner_->ready_state(); }
    std::vector<TimeRange> buffered() const override { return inner_->buffered(); }
    double playback_rate() const override { return inner_->playback_rate(); }
    void set_playback_rate(double rate) override { inner_->set_playback_rate(rate); }
    bool muted() const override { return inner_->muted(); }
    void set_muted(bool muted) override { inner_->set_muted(muted); }
    double volume() const override { return inner_->volume(); }
    void set_volume(double volume) override { inner_->set_volume(volume); }

    void play(PlayCallback done) override;
    void pause() override;

    bool play_pending() const { return play_pending_; }
    bool pause_deferred() const { return pause_deferred_; }
    const std::shared_ptr<IMediaElement>& inner() const { return inner_; }

private:
    void on_play_settled(PlayResult result);

    std::shared_ptr<IMediaElement> inner_;
    bool play_pending_ = false;
    bool pause_deferred_ = false;
    std::vector<PlayCallback> waiters_;
};

} // namespace engine
} // namespace syncroom

#endif // SERIALIZED_MEDIA_ELEMENT_H

#ifndef SINGLE_STREAM_TARGET_H
#define SINGLE_STREAM_TARGET_H

#include "playback_target.h"
#include "media_element.h"

#include <functional>
#include <memory>
#include <string>

namespace syncroom {
namespace engine {

/**
 * @class SingleStreamTarget
 * @brief Playback target for one muxed media element.
 * @details The element is wrapped in a `SerializedMediaElement`. A play rejected by the autoplay
 *          policy is retried once muted and a notice is raised.
 */
class SingleStreamTarget : public IPlaybackTarget,
                           public std::enable_shared_from_this<SingleStreamTarget> {
public:
    using NoticeCallback = std::function<void(const std::string&)>;

    explicit SingleStreamTarget(std::shared_ptr<IMediaElement> element);

    void set_notice_callback(NoticeCallback callback) { notice_callback_ = std::move(callback); }

    double current_time() const override;
    bool is_playing() const override { return intends_playing_; }
    void seek(double position) override;
    void play() override;
    void pause() override;
    double playback_rate() const override;
    void set_playback_rate(double rate) override;

    IMediaElement* element() const { return element_.get(); }

private:
    void on_play_result(PlayResult result, bool muted_retry);

    std::shared_ptr<IMediaElement> element_;
    bool intends_playing_ = false;
    NoticeCallback notice_callback_;
};

} // namespace engine
} // namespace syncroom

#endif // SINGLE_STREAM_TARGET_H

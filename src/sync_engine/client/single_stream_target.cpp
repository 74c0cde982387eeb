#include "single_stream_target.h"
#include "serialized_media_element.h"
#include "../utils/cpp_logger.h"

#include <stdexcept>

namespace syncroom {
namespace engine {

SingleStreamTarget::SingleStreamTarget(std::shared_ptr<IMediaElement> element)
    : element_(SerializedMediaElement::wrap(std::move(element))) {
    if (!element_) {
        throw std::invalid_argument("SingleStreamTarget requires an element");
    }
}

double SingleStreamTarget::current_time() const {
    return element_->current_time();
}

void SingleStreamTarget::seek(double position) {
    element_->set_current_time(position < 0.0 ? 0.0 : position);
}

void SingleStreamTarget::play() {
    intends_playing_ = true;
    std::weak_ptr<SingleStreamTarget> weak_self = weak_from_this();
    element_->play([weak_self](PlayResult result) {
        if (auto self = weak_self.lock()) {
            self->on_play_result(result, false);
        }
    });
}

void SingleStreamTarget::pause() {
    intends_playing_ = false;
    element_->pause();
}

double SingleStreamTarget::playback_rate() const {
    return element_->playback_rate();
}

void SingleStreamTarget::set_playback_rate(double rate) {
    if (element_->playback_rate() != rate) {
        element_->set_playback_rate(rate);
    }
}

void SingleStreamTarget::on_play_result(PlayResult result, bool muted_retry) {
    switch (result) {
        case PlayResult::Started:
            return;
        case PlayResult::NotAllowed:
            if (!muted_retry && intends_playing_) {
                LOG_CPP_WARNING("[SingleStreamTarget] Autoplay blocked, retrying muted.");
                element_->set_muted(true);
                if (notice_callback_) {
                    notice_callback_("Playback started muted. Unmute to hear audio.");
                }
                std::weak_ptr<SingleStreamTarget> weak_self = weak_from_this();
                element_->play([weak_self](PlayResult retry_result) {
                    if (auto self = weak_self.lock()) {
                        self->on_play_result(retry_result, true);
                    }
                });
                return;
            }
            LOG_CPP_ERROR("[SingleStreamTarget] Playback not allowed even when muted.");
            return;
        case PlayResult::Aborted:
            LOG_CPP_DEBUG("[SingleStreamTarget] Play aborted.");
            return;
        case PlayResult::Failed:
            LOG_CPP_ERROR("[SingleStreamTarget] Play failed.");
            return;
    }
}

} // namespace engine
} // namespace syncroom

#include "serialized_media_element.h"
#include "../utils/cpp_logger.h"

#include <stdexcept>

namespace syncroom {
namespace engine {

std::shared_ptr<SerializedMediaElement> SerializedMediaElement::wrap(std::shared_ptr<IMediaElement> inner) {
    if (!inner) {
        return nullptr;
    }
    if (auto existing = std::dynamic_pointer_cast<SerializedMediaElement>(inner)) {
        return existing;
    }
    return std::make_shared<SerializedMediaElement>(std::move(inner));
}

SerializedMediaElement::SerializedMediaElement(std::shared_ptr<IMediaElement> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw std::invalid_argument("SerializedMediaElement requires an element");
    }
}

void SerializedMediaElement::play(PlayCallback done) {
    pause_deferred_ = false;
    waiters_.push_back(std::move(done));
    if (play_pending_) {
        LOG_CPP_DEBUG("[SerializedMediaElement] Play joined the pending request (%zu waiting).", waiters_.size());
        return;
    }

    play_pending_ = true;
    std::weak_ptr<SerializedMediaElement> weak_self = weak_from_this();
    inner_->play([weak_self](PlayResult result) {
        if (auto self = weak_self.lock()) {
            self->on_play_settled(result);
        }
    });
}

void SerializedMediaElement::pause() {
    if (play_pending_) {
        LOG_CPP_DEBUG("[SerializedMediaElement] Pause deferred until the pending play settles.");
        pause_deferred_ = true;
        return;
    }
    inner_->pause();
}

void SerializedMediaElement::on_play_settled(PlayResult result) {
    play_pending_ = false;
    std::vector<PlayCallback> waiters;
    waiters.swap(waiters_);
    const bool pause_now = pause_deferred_;
    pause_deferred_ = false;

    if (pause_now) {
        inner_->pause();
    }
    for (auto& waiter : waiters) {
        if (waiter) {
            waiter(result);
        }
    }
}

} // namespace engine
} // namespace syncroom

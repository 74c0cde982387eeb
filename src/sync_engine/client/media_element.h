/**
 * @file media_element.h
 * @brief Abstract playback element driven by the client-side sync engines.
 * @details The host application (a browser bridge, a native player, a test fake) implements
 *          `IMediaElement` for each video or audio element it owns. All calls are made from the
 *          client loop thread. `play` is asynchronous: the element reports the outcome through the
 *          callback, which the host must invoke on the client loop thread as well.
 */
#ifndef MEDIA_ELEMENT_H
#define MEDIA_ELEMENT_H

#include <functional>
#include <vector>

namespace syncroom {
namespace engine {

/** @brief Outcome of an asynchronous play request. */
enum class PlayResult {
    Started,    ///< Playback began.
    NotAllowed, ///< Rejected by an autoplay policy. Usually succeeds again when muted.
    Aborted,    ///< Superseded by a pause or a new source before it started.
    Failed      ///< Any other error.
};

inline const char* play_result_name(PlayResult result) {
    switch (result) {
        case PlayResult::Started:    return "started";
        case PlayResult::NotAllowed: return "not_allowed";
        case PlayResult::Aborted:    return "aborted";
        case PlayResult::Failed:     return "failed";
    }
    return "failed";
}

using PlayCallback = std::function<void(PlayResult)>;

/** @brief A contiguous buffered interval in seconds. */
struct TimeRange {
    double start = 0.0;
    double end = 0.0;
};

class IMediaElement {
public:
    virtual ~IMediaElement() = default;

    virtual double current_time() const = 0;
    virtual void set_current_time(double seconds) = 0;
    virtual double duration() const = 0;

    virtual bool paused() const = 0;
    virtual bool seeking() const = 0;
    /** @brief HTML media ready state, 0 (HAVE_NOTHING) to 4 (HAVE_ENOUGH_DATA). */
    virtual int ready_state() const = 0;
    virtual std::vector<TimeRange> buffered() const = 0;

    virtual double playback_rate() const = 0;
    virtual void set_playback_rate(double rate) = 0;

    virtual void play(PlayCallback done) = 0;
    virtual void pause() = 0;

    virtual bool muted() const = 0;
    virtual void set_muted(bool muted) = 0;
    virtual double volume() const = 0;
    virtual void set_volume(double volume) = 0;
};

/**
 * @brief Seconds buffered ahead of the element's current time.
 * @return `end - current_time` of the buffered range containing the current time, or 0 if the
 *         current time is outside every range.
 */
inline double seconds_buffered_ahead(const IMediaElement& element) {
    const double t = element.current_time();
    for (const auto& range : element.buffered()) {
        if (t >= range.start && t <= range.end) {
            return range.end - t;
        }
    }
    return 0.0;
}

} // namespace engine
} // namespace syncroom

#endif // MEDIA_ELEMENT_H

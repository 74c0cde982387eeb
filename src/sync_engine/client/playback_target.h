#ifndef PLAYBACK_TARGET_H
#define PLAYBACK_TARGET_H

namespace syncroom {
namespace engine {

/**
 * @class IPlaybackTarget
 * @brief The local player as seen by the drift correction engine.
 * @details Implemented by `SingleStreamTarget` for muxed media and by `DualStreamSync` for
 *          separate video and audio elements.
 */
class IPlaybackTarget {
public:
    virtual ~IPlaybackTarget() = default;

    virtual double current_time() const = 0;
    /** @brief Whether local playback is intended to be running. */
    virtual bool is_playing() const = 0;

    virtual void seek(double position) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;

    virtual double playback_rate() const = 0;
    virtual void set_playback_rate(double rate) = 0;
};

} // namespace engine
} // namespace syncroom

#endif // PLAYBACK_TARGET_H

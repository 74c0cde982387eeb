/**
 * @file media_resolver.h
 * @brief Collaborators supplied by the host application to the client session.
 */
#ifndef MEDIA_RESOLVER_H
#define MEDIA_RESOLVER_H

#include "media_element.h"
#include "../sync_types.h"

#include <memory>
#include <optional>

namespace syncroom {
namespace engine {

/**
 * @class IMediaResolver
 * @brief Turns a queue item into playable stream locations.
 */
class IMediaResolver {
public:
    virtual ~IMediaResolver() = default;

    /** @return The resolved streams, or nullopt if the item cannot be played. */
    virtual std::optional<ResolvedMedia> resolve(const MediaItem& item) = 0;
};

/**
 * @class IQualitySwitchNotifier
 * @brief Told when the user picks another video quality. A prefetch hint only.
 */
class IQualitySwitchNotifier {
public:
    virtual ~IQualitySwitchNotifier() = default;

    virtual void on_quality_switch(const MediaItem& item, const QualityLevel& quality) = 0;
};

/** @brief Elements created by the host for one piece of media. */
struct LoadedMedia {
    std::shared_ptr<IMediaElement> primary;
    std::shared_ptr<IMediaElement> secondary;  ///< Null for single-stream media.
};

/**
 * @class IPlayerHost
 * @brief Creates and releases the media elements.
 */
class IPlayerHost {
public:
    virtual ~IPlayerHost() = default;

    /**
     * @brief Loads resolved media.
     * @return The elements, with `primary` null on failure. Dual-stream media must yield a
     *         secondary element.
     */
    virtual LoadedMedia load(const ResolvedMedia& media) = 0;

    /** @brief Releases the elements of the previously loaded media. */
    virtual void unload() = 0;
};

} // namespace engine
} // namespace syncroom

#endif // MEDIA_RESOLVER_H

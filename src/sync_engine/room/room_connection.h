#ifndef ROOM_CONNECTION_H
#define ROOM_CONNECTION_H

#include <string>

namespace syncroom {
namespace engine {

/**
 * @class IRoomConnection
 * @brief One client attached to a room. The unit of broadcast fan-out.
 * @details Implementations must be safe to call from any thread. `send` reports failure by
 *          returning false or by throwing; either marks the connection dead.
 */
class IRoomConnection {
public:
    virtual ~IRoomConnection() = default;

    /** @brief Unique id of this connection within the process. */
    virtual const std::string& id() const = 0;

    /** @brief The user identity the client connected as. */
    virtual const std::string& identity() const = 0;

    /** @brief Sends one text frame. */
    virtual bool send(const std::string& text) = 0;

    /** @brief Closes the underlying transport, if any. */
    virtual void close() = 0;
};

} // namespace engine
} // namespace syncroom

#endif // ROOM_CONNECTION_H

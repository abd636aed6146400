/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Store Client - Asynchronous read interface to the external configuration store
 */

#ifndef WAYPOINT_STORE_STORE_CLIENT_HPP
#define WAYPOINT_STORE_STORE_CLIENT_HPP

#include "store/resp.hpp"
#include "store/store_error.hpp"

#include <exception>
#include <functional>
#include <vector>

namespace waypoint::store {

/**
 * Completion of a command batch
 *
 * On success error is null and replies holds one reply per command, in
 * order. Error replies (-ERR ...) are delivered as values; error is set only
 * when the exchange itself failed (connect, timeout, transport, framing).
 */
using ReplyHandler = std::function<void(std::exception_ptr error, std::vector<resp::Value> replies)>;

/**
 * Store client interface
 *
 * The decision layer only reads. A round-trip never blocks the calling
 * thread: the caller's continuation runs from the handler. Implementations
 * are not thread-safe; a client serves one batch at a time (see StorePool)
 * and must stay alive until the handler has run.
 */
class StoreClient {
public:
    virtual ~StoreClient() = default;

    /**
     * Send a batch of commands in one round-trip
     *
     * The handler is invoked exactly once. It may run before this call
     * returns, and it may release the client.
     */
    virtual void async_execute(std::vector<Command> commands, ReplyHandler handler) = 0;

    /**
     * Whether the connection can be reused for another batch
     *
     * A connection the peer has closed, or one holding unsolicited bytes,
     * reports false.
     */
    virtual bool is_open() { return true; }
};

} // namespace waypoint::store

#endif // WAYPOINT_STORE_STORE_CLIENT_HPP

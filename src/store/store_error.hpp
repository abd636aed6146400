/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Store Error - Failure raised by the configuration store layer
 */

#ifndef WAYPOINT_STORE_STORE_ERROR_HPP
#define WAYPOINT_STORE_STORE_ERROR_HPP

#include <stdexcept>

namespace waypoint::store {

/**
 * Raised when the store cannot be reached, times out, or answers with
 * something that is not a valid reply. Absence of a key is not an error.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace waypoint::store

#endif // WAYPOINT_STORE_STORE_ERROR_HPP

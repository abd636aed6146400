/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * RESP - Redis serialization protocol (RESP2) encoder and incremental parser
 */

#ifndef WAYPOINT_STORE_RESP_HPP
#define WAYPOINT_STORE_RESP_HPP

#include "store/store_error.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::store {

/**
 * One command as its argument list, name first
 */
using Command = std::vector<std::string>;

} // namespace waypoint::store

namespace waypoint::store::resp {

/**
 * Malformed reply from the server
 */
class ProtocolError : public StoreError {
public:
    using StoreError::StoreError;
};

enum class Type {
    simple_string,
    error,
    integer,
    bulk_string,
    array,
    null        // Null bulk string ($-1) or null array (*-1)
};

/**
 * A decoded reply
 */
struct Value {
    Type type{Type::null};
    std::string str;                // simple_string, error, bulk_string
    std::int64_t integer{0};
    std::vector<Value> elements;    // array

    bool is_null() const noexcept { return type == Type::null; }
    bool is_error() const noexcept { return type == Type::error; }
};

/**
 * Encode a command as an array of bulk strings
 */
std::string encode_command(std::initializer_list<std::string_view> args);

/**
 * Encode a batch of commands back to back, for pipelining
 */
std::string encode_commands(const std::vector<Command>& commands);

/**
 * Try to parse one complete reply from the front of the buffer
 *
 * @param buffer Bytes received so far
 * @param consumed Set to the number of bytes the reply occupied
 * @return The reply, or nullopt if the buffer does not yet hold a full reply
 * @throws ProtocolError on malformed input
 */
std::optional<Value> parse(std::string_view buffer, std::size_t& consumed);

/**
 * Decode a string reply (GET)
 * @return nullopt for a null reply
 * @throws StoreError on an error reply, ProtocolError on any other reply type
 */
std::optional<std::string> as_string(const Value& reply, std::string_view command);

/**
 * Decode an array reply (SMEMBERS, LRANGE); a null reply is an empty list
 * @throws StoreError on an error reply, ProtocolError on any other reply type
 */
std::vector<std::string> as_string_list(const Value& reply, std::string_view command);

} // namespace waypoint::store::resp

#endif // WAYPOINT_STORE_RESP_HPP

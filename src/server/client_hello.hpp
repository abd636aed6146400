/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Client Hello - Extract the SNI server name from the first TLS handshake bytes
 *
 * Lets a TLS session read the requested name before OpenSSL sees the
 * handshake, so the certificate lookup can run asynchronously and the
 * buffered bytes are then handed to the handshake unchanged.
 */

#ifndef WAYPOINT_SERVER_CLIENT_HELLO_HPP
#define WAYPOINT_SERVER_CLIENT_HELLO_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace waypoint::server {

/**
 * Upper bound on the bytes buffered while waiting for a full ClientHello
 */
constexpr std::size_t kMaxClientHelloSize = 32 * 1024;

enum class ClientHelloStatus {
    incomplete,     // Read more bytes
    complete,       // The whole ClientHello was seen
    invalid         // Not a TLS ClientHello; let the handshake reject it
};

struct ClientHelloInfo {
    ClientHelloStatus status{ClientHelloStatus::incomplete};
    std::string server_name;    // Lowercase host_name entry, empty without SNI
};

/**
 * Inspect the bytes received so far on a TLS connection
 *
 * Handshake fragments are joined across records.
 */
ClientHelloInfo inspect_client_hello(std::string_view data);

} // namespace waypoint::server

#endif // WAYPOINT_SERVER_CLIENT_HELLO_HPP

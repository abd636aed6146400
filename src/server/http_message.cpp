/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * HTTP Message helpers
 */

#include "server/http_message.hpp"

#include <algorithm>
#include <cctype>

namespace waypoint::server {

std::string normalize_host_header(std::string_view value) {
    std::string_view host = value;

    if (host.starts_with('[')) {
        // IPv6 literal, keep the brackets
        auto close = host.find(']');
        if (close != std::string_view::npos) {
            host = host.substr(0, close + 1);
        }
    } else if (auto colon = host.find(':'); colon != std::string_view::npos) {
        host = host.substr(0, colon);
    }

    std::string result(host);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::pair<std::string, std::string> split_target(std::string_view target) {
    auto question = target.find('?');
    if (question == std::string_view::npos) {
        return {std::string(target), std::string()};
    }
    return {std::string(target.substr(0, question)), std::string(target.substr(question + 1))};
}

} // namespace waypoint::server

/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Route Model Implementation
 */

#include "routing/route.hpp"

#include <algorithm>
#include <charconv>

namespace waypoint::routing {

namespace {

/**
 * Assign j[key] to out unless it is absent or null
 */
template<typename T>
void get_if_present(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

template<typename T>
std::optional<T> parse_unsigned(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::string BackendTarget::to_string() const {
    return address + ":" + std::to_string(port);
}

void from_json(const nlohmann::json& j, Route& r) {
    get_if_present(j, "host", r.host);
    get_if_present(j, "path", r.path);
    get_if_present(j, "enabled", r.enabled);
    get_if_present(j, "strip_path", r.strip_path);
    get_if_present(j, "preserve_host", r.preserve_host);
    get_if_present(j, "protocol", r.protocol);
    get_if_present(j, "load_balancer", r.load_balancer);

    if (r.path.empty()) {
        r.path = "/";
    }
}

std::optional<Route> parse_route(std::string_view id, std::string_view document) {
    try {
        auto j = nlohmann::json::parse(document);
        if (!j.is_object()) {
            return std::nullopt;
        }
        Route route = j.get<Route>();
        route.id = std::string(id);
        return route;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<BackendTarget> parse_target(std::string_view entry) {
    // Split on ':' dropping empty fields, so "a::80" reads as "a:80"
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= entry.size()) {
        auto colon = entry.find(':', start);
        auto end = colon == std::string_view::npos ? entry.size() : colon;
        if (end > start) {
            parts.push_back(entry.substr(start, end - start));
        }
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }

    if (parts.size() < 2) {
        return std::nullopt;
    }

    auto port = parse_unsigned<std::uint16_t>(parts[1]);
    if (!port || *port == 0) {
        return std::nullopt;
    }

    BackendTarget target;
    target.address = std::string(parts[0]);
    target.port = *port;

    if (parts.size() >= 3) {
        auto weight = parse_unsigned<std::uint32_t>(parts[2]);
        if (weight && *weight > 0) {
            target.weight = std::min(*weight, kMaxTargetWeight);
        }
    }

    return target;
}

} // namespace waypoint::routing

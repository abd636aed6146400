/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Host Normalizer Implementation
 */

#include "routing/host_normalizer.hpp"

#include <array>
#include <cctype>

namespace waypoint::routing {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

/**
 * Consume one or more characters of a class starting at pos
 */
template<typename Pred>
bool consume_run(std::string_view s, std::size_t& pos, Pred pred) {
    std::size_t start = pos;
    while (pos < s.size() && pred(s[pos])) {
        ++pos;
    }
    return pos > start;
}

bool consume_char(std::string_view s, std::size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

/**
 * Whether tail is exactly ".D<sep>D<sep>D<sep>D.W.W" (D digits, W alphanumerics)
 */
bool is_embedded_ip_tail(std::string_view tail, char separator) {
    std::size_t pos = 0;
    if (!consume_char(tail, pos, '.')) return false;

    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0 && !consume_char(tail, pos, separator)) return false;
        if (!consume_run(tail, pos, is_digit)) return false;
    }

    for (int label = 0; label < 2; ++label) {
        if (!consume_char(tail, pos, '.')) return false;
        if (!consume_run(tail, pos, is_alnum)) return false;
    }

    return pos == tail.size();
}

/**
 * Cut the host at the leftmost '.' where an embedded-IP tail begins
 */
std::string strip_embedded_ip(std::string_view host, char separator) {
    for (std::size_t dot = host.find('.'); dot != std::string_view::npos; dot = host.find('.', dot + 1)) {
        if (is_embedded_ip_tail(host.substr(dot), separator)) {
            return std::string(host.substr(0, dot));
        }
    }
    return std::string(host);
}

constexpr std::array<NormalizationRule, 8> kDefaultRules{{
    {".nip.io", strip_dotted_ip},
    {".nip.io", strip_dashed_ip},
    {".sslip.io", strip_dotted_ip},
    {".sslip.io", strip_dashed_ip},
    {".lvh.me", strip_dotted_ip},
    {".lvh.me", strip_dashed_ip},
    {".localtest.me", strip_dotted_ip},
    {".localtest.me", strip_dashed_ip},
}};

} // anonymous namespace

std::string strip_dotted_ip(std::string_view host) {
    return strip_embedded_ip(host, '.');
}

std::string strip_dashed_ip(std::string_view host) {
    return strip_embedded_ip(host, '-');
}

std::span<const NormalizationRule> default_rules() noexcept {
    return kDefaultRules;
}

std::string normalize_host(std::string_view host, std::span<const NormalizationRule> rules) {
    for (const auto& rule : rules) {
        if (!host.ends_with(rule.suffix)) {
            continue;
        }
        std::string base = rule.strip(host);
        if (base != host) {
            return base;
        }
    }
    return std::string(host);
}

std::string normalize_host(std::string_view host) {
    return normalize_host(host, default_rules());
}

} // namespace waypoint::routing

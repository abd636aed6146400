/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Client Hello implementation
 */

#include "server/client_hello.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>

namespace waypoint::server {

namespace {

constexpr std::uint8_t kHandshakeRecord = 0x16;
constexpr std::uint8_t kClientHello = 0x01;
constexpr std::uint16_t kServerNameExtension = 0x0000;
constexpr std::uint8_t kHostNameType = 0x00;
constexpr std::size_t kRecordHeaderSize = 5;
constexpr std::size_t kMaxRecordSize = 16384 + 2048;

/**
 * Bounds-checked big-endian reader over a handshake message
 */
class Reader {
public:
    explicit Reader(std::string_view data)
        : data_(data) {
    }

    std::optional<std::size_t> read(std::size_t width) {
        if (remaining() < width) {
            return std::nullopt;
        }
        std::size_t value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            value = (value << 8) | static_cast<std::uint8_t>(data_[pos_ + i]);
        }
        pos_ += width;
        return value;
    }

    std::optional<std::string_view> take(std::size_t count) {
        if (remaining() < count) {
            return std::nullopt;
        }
        auto bytes = data_.substr(pos_, count);
        pos_ += count;
        return bytes;
    }

    bool skip(std::size_t count) {
        return take(count).has_value();
    }

    // Skip a vector prefixed by a length of the given width
    bool skip_vector(std::size_t length_width) {
        auto length = read(length_width);
        return length && skip(*length);
    }

    std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::string_view data_;
    std::size_t pos_{0};
};

ClientHelloInfo invalid() {
    return ClientHelloInfo{ClientHelloStatus::invalid, {}};
}

std::string to_lower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/**
 * Parse a ClientHello body (after the 4-byte handshake header)
 */
ClientHelloInfo parse_body(std::string_view body) {
    Reader reader(body);

    // client_version, random, session_id, cipher_suites, compression_methods
    if (!reader.skip(2 + 32) || !reader.skip_vector(1) || !reader.skip_vector(2) || !reader.skip_vector(1)) {
        return invalid();
    }

    ClientHelloInfo info{ClientHelloStatus::complete, {}};
    if (reader.remaining() == 0) {
        return info;
    }

    auto extensions_length = reader.read(2);
    if (!extensions_length) {
        return invalid();
    }
    auto extensions = reader.take(*extensions_length);
    if (!extensions) {
        return invalid();
    }

    Reader ext_reader(*extensions);
    while (ext_reader.remaining() > 0) {
        auto type = ext_reader.read(2);
        auto length = ext_reader.read(2);
        if (!type || !length) {
            return invalid();
        }
        auto ext_data = ext_reader.take(*length);
        if (!ext_data) {
            return invalid();
        }
        if (*type != kServerNameExtension) {
            continue;
        }

        Reader names(*ext_data);
        auto list_length = names.read(2);
        if (!list_length) {
            return invalid();
        }
        auto list = names.take(*list_length);
        if (!list) {
            return invalid();
        }

        Reader entries(*list);
        while (entries.remaining() > 0) {
            auto name_type = entries.read(1);
            auto name_length = entries.read(2);
            if (!name_type || !name_length) {
                return invalid();
            }
            auto name = entries.take(*name_length);
            if (!name) {
                return invalid();
            }
            if (*name_type == kHostNameType) {
                info.server_name = to_lower(*name);
                return info;
            }
        }
    }

    return info;
}

} // anonymous namespace

ClientHelloInfo inspect_client_hello(std::string_view data) {
    std::string handshake;
    std::size_t pos = 0;

    while (data.size() - pos >= kRecordHeaderSize) {
        auto content_type = static_cast<std::uint8_t>(data[pos]);
        auto major_version = static_cast<std::uint8_t>(data[pos + 1]);
        std::size_t record_length = (static_cast<std::size_t>(static_cast<std::uint8_t>(data[pos + 3])) << 8) |
                                    static_cast<std::uint8_t>(data[pos + 4]);

        if (content_type != kHandshakeRecord || major_version != 0x03 ||
            record_length == 0 || record_length > kMaxRecordSize) {
            return invalid();
        }
        if (data.size() - pos - kRecordHeaderSize < record_length) {
            break;
        }

        handshake.append(data.substr(pos + kRecordHeaderSize, record_length));
        pos += kRecordHeaderSize + record_length;

        if (handshake.size() < 4) {
            continue;
        }
        if (static_cast<std::uint8_t>(handshake[0]) != kClientHello) {
            return invalid();
        }

        Reader header(std::string_view(handshake).substr(1, 3));
        std::size_t body_length = *header.read(3);
        if (body_length + 4 > kMaxClientHelloSize) {
            return invalid();
        }
        if (handshake.size() >= body_length + 4) {
            return parse_body(std::string_view(handshake).substr(4, body_length));
        }
    }

    // A non-TLS first byte is rejected without waiting for a full header
    if (pos < data.size() && static_cast<std::uint8_t>(data[pos]) != kHandshakeRecord) {
        return invalid();
    }
    if (data.size() >= kMaxClientHelloSize) {
        return invalid();
    }
    return ClientHelloInfo{ClientHelloStatus::incomplete, {}};
}

} // namespace waypoint::server

/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * RESP Implementation
 */

#include "store/resp.hpp"

#include <charconv>

namespace waypoint::store::resp {

namespace {

constexpr std::int64_t kMaxBulkLength = 512LL * 1024 * 1024;
constexpr std::int64_t kMaxArrayLength = 1024 * 1024;
constexpr int kMaxDepth = 8;

/**
 * Read a CRLF-terminated line starting at pos; advances pos past the CRLF
 */
std::optional<std::string_view> read_line(std::string_view buffer, std::size_t& pos) {
    auto end = buffer.find("\r\n", pos);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    auto line = buffer.substr(pos, end - pos);
    pos = end + 2;
    return line;
}

std::int64_t parse_integer(std::string_view text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw ProtocolError("RESP: invalid integer '" + std::string(text) + "'");
    }
    return value;
}

std::optional<Value> parse_at(std::string_view buffer, std::size_t& pos, int depth) {
    if (depth > kMaxDepth) {
        throw ProtocolError("RESP: reply nested too deeply");
    }
    if (pos >= buffer.size()) {
        return std::nullopt;
    }

    char marker = buffer[pos];
    std::size_t cursor = pos + 1;

    auto line = read_line(buffer, cursor);
    if (!line) {
        return std::nullopt;
    }

    Value value;
    switch (marker) {
        case '+':
            value.type = Type::simple_string;
            value.str = std::string(*line);
            break;

        case '-':
            value.type = Type::error;
            value.str = std::string(*line);
            break;

        case ':':
            value.type = Type::integer;
            value.integer = parse_integer(*line);
            break;

        case '$': {
            std::int64_t length = parse_integer(*line);
            if (length == -1) {
                value.type = Type::null;
                break;
            }
            if (length < 0 || length > kMaxBulkLength) {
                throw ProtocolError("RESP: invalid bulk length " + std::to_string(length));
            }
            auto size = static_cast<std::size_t>(length);
            if (buffer.size() < cursor + size + 2) {
                return std::nullopt;
            }
            if (buffer.compare(cursor + size, 2, "\r\n") != 0) {
                throw ProtocolError("RESP: bulk string not terminated by CRLF");
            }
            value.type = Type::bulk_string;
            value.str = std::string(buffer.substr(cursor, size));
            cursor += size + 2;
            break;
        }

        case '*': {
            std::int64_t count = parse_integer(*line);
            if (count == -1) {
                value.type = Type::null;
                break;
            }
            if (count < 0 || count > kMaxArrayLength) {
                throw ProtocolError("RESP: invalid array length " + std::to_string(count));
            }
            value.type = Type::array;
            value.elements.reserve(static_cast<std::size_t>(count));
            for (std::int64_t i = 0; i < count; ++i) {
                auto element = parse_at(buffer, cursor, depth + 1);
                if (!element) {
                    return std::nullopt;
                }
                value.elements.push_back(std::move(*element));
            }
            break;
        }

        default:
            throw ProtocolError(std::string("RESP: unexpected type marker '") + marker + "'");
    }

    pos = cursor;
    return value;
}

template<class Range>
void append_command(std::string& out, const Range& args) {
    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (std::string_view arg : args) {
        out += '$';
        out += std::to_string(arg.size());
        out += "\r\n";
        out.append(arg.data(), arg.size());
        out += "\r\n";
    }
}

} // anonymous namespace

std::string encode_command(std::initializer_list<std::string_view> args) {
    std::string out;
    out.reserve(16 * args.size());
    append_command(out, args);
    return out;
}

std::string encode_commands(const std::vector<Command>& commands) {
    std::string out;
    for (const auto& command : commands) {
        append_command(out, command);
    }
    return out;
}

std::optional<Value> parse(std::string_view buffer, std::size_t& consumed) {
    std::size_t pos = 0;
    auto value = parse_at(buffer, pos, 0);
    consumed = value ? pos : 0;
    return value;
}

std::optional<std::string> as_string(const Value& reply, std::string_view command) {
    switch (reply.type) {
        case Type::null:
            return std::nullopt;
        case Type::bulk_string:
        case Type::simple_string:
            return reply.str;
        case Type::error:
            throw StoreError(std::string(command) + ": " + reply.str);
        default:
            throw ProtocolError(std::string(command) + ": unexpected reply type");
    }
}

std::vector<std::string> as_string_list(const Value& reply, std::string_view command) {
    if (reply.is_null()) {
        return {};
    }
    if (reply.is_error()) {
        throw StoreError(std::string(command) + ": " + reply.str);
    }
    if (reply.type != Type::array) {
        throw ProtocolError(std::string(command) + ": expected array reply");
    }

    std::vector<std::string> out;
    out.reserve(reply.elements.size());
    for (const auto& element : reply.elements) {
        if (element.type == Type::bulk_string || element.type == Type::simple_string) {
            out.push_back(element.str);
        } else if (element.type == Type::integer) {
            out.push_back(std::to_string(element.integer));
        }
    }
    return out;
}

} // namespace waypoint::store::resp

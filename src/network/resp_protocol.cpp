#include "network/resp_protocol.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace notes::network {

namespace {

constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

using ReadResult = std::variant<RespReply, ClientError>;

// Read a CRLF-terminated line from the stream.  Returns the line content
// (without the trailing \r\n).  On error, returns false via the bool.
boost::asio::awaitable<std::pair<std::string, bool>>
read_line(boost::beast::tcp_stream& stream, std::string& buf) {
    auto [ec, n] = co_await boost::asio::async_read_until(
        stream, boost::asio::dynamic_buffer(buf), "\r\n", use_awaitable);

    if (ec) {
        co_return std::pair<std::string, bool>{ec.message(), false};
    }

    // n includes the \r\n
    std::string line = buf.substr(0, n - 2);
    buf.erase(0, n);
    co_return std::pair<std::string, bool>{std::move(line), true};
}

// Read exactly `count` bytes + trailing \r\n from the stream.
boost::asio::awaitable<std::pair<std::string, bool>>
read_bulk(boost::beast::tcp_stream& stream, std::string& buf, std::size_t count) {
    const std::size_t need = count + 2; // data + \r\n

    if (buf.size() < need) {
        auto [ec, n] = co_await boost::asio::async_read(
            stream, boost::asio::dynamic_buffer(buf),
            boost::asio::transfer_exactly(need - buf.size()), use_awaitable);
        if (ec) {
            co_return std::pair<std::string, bool>{ec.message(), false};
        }
    }

    if (buf.compare(count, 2, "\r\n") != 0) {
        co_return std::pair<std::string, bool>{"bulk string not terminated by CRLF", false};
    }

    std::string data = buf.substr(0, count);
    buf.erase(0, need);
    co_return std::pair<std::string, bool>{std::move(data), true};
}

// Parse an integer from a string_view (used for counts, lengths, integers).
bool parse_int(std::string_view sv, int64_t& out) {
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

boost::asio::awaitable<ReadResult>
read_value(boost::beast::tcp_stream& stream, std::string& buf, int depth) {
    if (depth > kMaxRespDepth) {
        co_return ClientError{"RESP nesting too deep"};
    }

    auto [line, ok] = co_await read_line(stream, buf);
    if (!ok) {
        co_return ClientError{"read failed: " + line};
    }
    if (line.empty()) {
        co_return ClientError{"empty RESP line"};
    }

    const char type = line[0];
    std::string_view payload{line.data() + 1, line.size() - 1};

    switch (type) {
        case '+':
            co_return resp_simple(std::string(payload));

        case '-':
            co_return resp_error(std::string(payload));

        case ':': {
            int64_t val = 0;
            if (!parse_int(payload, val)) {
                co_return ClientError{"invalid integer reply"};
            }
            co_return resp_integer(val);
        }

        case '$': {
            int64_t len = 0;
            if (!parse_int(payload, len)) {
                co_return ClientError{"invalid bulk length"};
            }
            if (len < 0) {
                co_return resp_null(); // null bulk string
            }
            auto [data, ok2] = co_await read_bulk(stream, buf, static_cast<std::size_t>(len));
            if (!ok2) {
                co_return ClientError{"bulk read failed: " + data};
            }
            co_return resp_bulk(std::move(data));
        }

        case '*': {
            int64_t count = 0;
            if (!parse_int(payload, count)) {
                co_return ClientError{"invalid array count"};
            }
            if (count < 0) {
                co_return resp_null(); // null array
            }
            std::vector<RespReply> elements;
            // The count is untrusted; do not let it size the allocation.
            elements.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                auto elem = co_await read_value(stream, buf, depth + 1);
                if (auto* err = std::get_if<ClientError>(&elem)) {
                    co_return std::move(*err);
                }
                elements.push_back(std::move(std::get<RespReply>(elem)));
            }
            co_return resp_array(std::move(elements));
        }

        default:
            co_return ClientError{"unknown RESP type: " + std::string(1, type)};
    }
}

} // anonymous namespace

// ── RESP serializers ─────────────────────────────────────────────────────────

std::string serialize_resp_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n" + a + "\r\n";
    }
    return out;
}

std::string serialize_resp_reply(const RespReply& reply) {
    switch (reply.type) {
        case RespReply::Type::SimpleString:
            return "+" + reply.str + "\r\n";
        case RespReply::Type::Error:
            return "-" + reply.str + "\r\n";
        case RespReply::Type::Integer:
            return ":" + std::to_string(reply.integer) + "\r\n";
        case RespReply::Type::BulkString:
            return "$" + std::to_string(reply.str.size()) + "\r\n" + reply.str + "\r\n";
        case RespReply::Type::Null:
            return "$-1\r\n";
        case RespReply::Type::Array: {
            std::string out = "*" + std::to_string(reply.elements.size()) + "\r\n";
            for (const auto& e : reply.elements) {
                out += serialize_resp_reply(e);
            }
            return out;
        }
    }
    return "$-1\r\n";
}

// ── RESP reader ──────────────────────────────────────────────────────────────

boost::asio::awaitable<std::variant<RespReply, ClientError>>
read_resp_reply(boost::beast::tcp_stream& stream, std::string& buf) {
    co_return co_await read_value(stream, buf, 0);
}

// ── Reply builders ───────────────────────────────────────────────────────────

RespReply resp_simple(std::string s) {
    RespReply r;
    r.type = RespReply::Type::SimpleString;
    r.str  = std::move(s);
    return r;
}

RespReply resp_error(std::string message) {
    RespReply r;
    r.type = RespReply::Type::Error;
    r.str  = std::move(message);
    return r;
}

RespReply resp_integer(int64_t v) {
    RespReply r;
    r.type    = RespReply::Type::Integer;
    r.integer = v;
    return r;
}

RespReply resp_bulk(std::string s) {
    RespReply r;
    r.type = RespReply::Type::BulkString;
    r.str  = std::move(s);
    return r;
}

RespReply resp_null() {
    return RespReply{};
}

RespReply resp_array(std::vector<RespReply> elements) {
    RespReply r;
    r.type     = RespReply::Type::Array;
    r.elements = std::move(elements);
    return r;
}

} // namespace notes::network

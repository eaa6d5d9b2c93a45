#pragma once

#include "network/client_error.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace notes::network {

// ── RespReply ────────────────────────────────────────────────────────────────
//
// One decoded RESP2 value.  Arrays nest (SCAN returns [cursor, [keys...]]).
// A RESP request is itself an array of bulk strings, so the same type and
// reader serve both directions.

struct RespReply {
    enum class Type : uint8_t {
        SimpleString,   // +OK
        Error,          // -ERR message
        Integer,        // :1
        BulkString,     // $5 hello
        Null,           // $-1 or *-1
        Array,          // *N ...
    };

    Type                   type = Type::Null;
    std::string            str;       // SimpleString, Error, BulkString
    int64_t                integer = 0;
    std::vector<RespReply> elements;  // Array

    [[nodiscard]] bool is_error() const noexcept { return type == Type::Error; }
    [[nodiscard]] bool is_null() const noexcept  { return type == Type::Null; }
};

// Nested arrays deeper than this are rejected as malformed.
inline constexpr int kMaxRespDepth = 8;

// ── RESP serializers ─────────────────────────────────────────────────────────

// Serialize a command into a RESP array of bulk strings:
//   *N\r\n$len\r\narg\r\n...
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_resp_command(const std::vector<std::string>& args);

// Serialize a reply into RESP wire format (used by servers and test fakes).
[[nodiscard]] std::string serialize_resp_reply(const RespReply& reply);

// ── RESP reader (streaming) ──────────────────────────────────────────────────

// Read one complete RESP value from `stream`.  `buf` is a persistent read
// buffer owned by the connection: bytes read past the end of this value stay
// in it for the next call.
//
// Returns the value on success, ClientError on I/O error, timeout or
// malformed framing.
[[nodiscard]] boost::asio::awaitable<std::variant<RespReply, ClientError>>
read_resp_reply(boost::beast::tcp_stream& stream, std::string& buf);

// ── Reply builders ───────────────────────────────────────────────────────────

[[nodiscard]] RespReply resp_simple(std::string s);
[[nodiscard]] RespReply resp_error(std::string message);
[[nodiscard]] RespReply resp_integer(int64_t v);
[[nodiscard]] RespReply resp_bulk(std::string s);
[[nodiscard]] RespReply resp_null();
[[nodiscard]] RespReply resp_array(std::vector<RespReply> elements);

} // namespace notes::network

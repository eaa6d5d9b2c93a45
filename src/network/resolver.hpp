#pragma once

#include "network/client_error.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <string>
#include <variant>

namespace notes::network {

using ResolveResult = std::variant<boost::asio::ip::tcp::resolver::results_type, ClientError>;

// ── resolve ──────────────────────────────────────────────────────────────────
//
// Asynchronous host lookup bounded by `timeout`.
//
// When the deadline passes first the caller gets a ClientError straight away
// and the lookup is cancelled; a getaddrinfo() call already running finishes
// in the background and its result is dropped.
//
// Must be awaited on a strand (or a single-threaded executor): the lookup
// completion and the deadline share state on the calling executor.

[[nodiscard]] boost::asio::awaitable<ResolveResult>
resolve(std::string host, std::string port, std::chrono::milliseconds timeout);

} // namespace notes::network

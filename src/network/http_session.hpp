#pragma once

#include "network/router.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>

namespace notes::network {

// Handles one HTTP/1.1 connection for its lifetime.
//
// Each HttpSession is co_spawned from HttpServer::accept_loop() onto the
// strand its socket was accepted on.  Requests are read one at a time, passed
// to the Router and answered in order; the loop ends when the client closes,
// asks for Connection: close, stays idle past kIdleTimeout, or sends a body
// larger than kMaxBodyBytes (answered with 413).
class HttpSession {
public:
    static constexpr std::size_t          kMaxBodyBytes = 1024u * 1024u; // 1 MiB
    static constexpr std::chrono::seconds kIdleTimeout{30};

    HttpSession(boost::asio::ip::tcp::socket socket, Router& router,
                std::shared_ptr<spdlog::logger> logger);

    boost::asio::awaitable<void> run();

private:
    boost::beast::tcp_stream        stream_;
    Router&                         router_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace notes::network

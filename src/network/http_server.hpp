#pragma once

#include "network/router.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string>

namespace notes::network {

// Binds the HTTP listener on a shared io_context and accepts connections.
//
// Usage:
//   HttpServer srv{ioc, "0.0.0.0", 8080, router, logger};
//   srv.run(threads);   // blocks until SIGINT/SIGTERM
//
// The acceptor is bound in the constructor, so a bind failure throws
// boost::system::system_error before anything runs.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, std::string host, std::uint16_t port,
               Router& router, std::shared_ptr<spdlog::logger> logger);

    // Spawns the accept loop without running the io_context.
    void start();

    // start(), installs SIGINT / SIGTERM handlers, then runs the io_context on
    // `threads` threads (the calling thread included).  Blocks until stop().
    void run(unsigned int threads);

    // Closes the acceptor and stops the io_context.
    void stop();

    // Port actually bound (differs from the requested one when that was 0).
    [[nodiscard]] std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    boost::asio::awaitable<void> accept_loop();

    boost::asio::io_context&        ioc_;
    std::string                     host_;
    Router&                         router_;
    std::shared_ptr<spdlog::logger> logger_;
    boost::asio::ip::tcp::acceptor  acceptor_;
};

} // namespace notes::network

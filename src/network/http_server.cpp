#include "network/http_server.hpp"
#include "network/http_session.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

namespace notes::network {

namespace asio = boost::asio;

HttpServer::HttpServer(asio::io_context& ioc, std::string host, std::uint16_t port,
                       Router& router, std::shared_ptr<spdlog::logger> logger)
    : ioc_(ioc),
      host_(std::move(host)),
      router_(router),
      logger_(std::move(logger)),
      acceptor_(asio::make_strand(ioc)) {
    const auto address = asio::ip::make_address(host_);
    const asio::ip::tcp::endpoint endpoint{address, port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    logger_->info("Server listening on {}:{}", host_, this->port());
}

void HttpServer::start() {
    asio::co_spawn(acceptor_.get_executor(), accept_loop(), asio::detached);
}

void HttpServer::run(unsigned int threads) {
    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logger_->info("Received signal {}, shutting down", signo);
            stop();
        }
    });

    start();

    const unsigned int nthreads = std::max(1u, threads);
    std::vector<std::thread> pool;
    pool.reserve(nthreads - 1);
    for (unsigned int i = 1; i < nthreads; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    logger_->info("io_context stopped, all threads joined");
}

void HttpServer::stop() {
    asio::dispatch(acceptor_.get_executor(), [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();
}

asio::awaitable<void> HttpServer::accept_loop() {
    constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

    for (;;) {
        // Each connection gets its own strand.
        auto [ec, socket] = co_await acceptor_.async_accept(asio::make_strand(ioc_),
                                                            use_awaitable);
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                logger_->warn("Accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        // Disable Nagle – send responses immediately.
        boost::system::error_code opt_ec;
        socket.set_option(asio::ip::tcp::no_delay(true), opt_ec);

        auto executor = socket.get_executor();
        auto session  = std::make_shared<HttpSession>(std::move(socket), router_, logger_);
        asio::co_spawn(
            executor,
            [sp = std::move(session)]() -> asio::awaitable<void> {
                co_await sp->run();
            },
            asio::detached);
    }

    logger_->info("Accept loop exited");
}

} // namespace notes::network

#pragma once

#include "common/service_config.hpp"
#include "network/resp_protocol.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace notes::network {

using RedisResult = std::variant<RespReply, ClientError>;

// ── RedisConnection ──────────────────────────────────────────────────────────
//
// One TCP connection to a Redis-compatible server.
//
//   - Connects lazily on the first execute(), then sends AUTH / SELECT when
//     configured.
//   - Every connect and request/reply exchange is bounded by the configured
//     timeout (beast::tcp_stream expiry).
//   - All I/O runs on the connection's strand_: callers co_spawn execute()
//     onto strand() (RedisClient does this).
//   - After any ClientError the socket is closed and the connection must be
//     discarded.
//
// Not safe for concurrent execute() calls; RedisClient hands each connection
// to one caller at a time.

class RedisConnection {
public:
    RedisConnection(boost::asio::io_context& ioc,
                    const RedisConfig& config,
                    std::shared_ptr<spdlog::logger> logger);

    RedisConnection(const RedisConnection&)            = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    // Send one command and read its reply.  A server error reply (-ERR) is a
    // successful exchange and comes back as a RespReply of type Error.
    [[nodiscard]] boost::asio::awaitable<RedisResult> execute(std::vector<std::string> args);

    [[nodiscard]] bool is_connected() const noexcept { return connected_; }

    // True when the last execute() failed because the server had closed the
    // connection before any reply byte arrived.
    [[nodiscard]] bool closed_by_peer() const noexcept { return closed_by_peer_; }

    [[nodiscard]] boost::asio::strand<boost::asio::io_context::executor_type>&
    strand() noexcept { return strand_; }

private:
    // Resolve + connect + handshake.  Returns a ClientError on failure.
    [[nodiscard]] boost::asio::awaitable<std::variant<std::monostate, ClientError>> connect();

    // Write `args` and read one reply, with the timeout armed.
    [[nodiscard]] boost::asio::awaitable<RedisResult> exchange(const std::vector<std::string>& args);

    // Close the socket after a failure.
    void fail();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::beast::tcp_stream stream_;
    std::string              read_buf_;
    bool                     connected_ = false;
    bool                     closed_by_peer_ = false;

    std::string               host_;
    uint16_t                  port_;
    std::string               password_;
    uint32_t                  db_;
    std::chrono::milliseconds timeout_;

    std::shared_ptr<spdlog::logger> logger_;
};

// ── RedisClient ──────────────────────────────────────────────────────────────
//
// Small connection pool in front of RedisConnection.
//
// command() checks out an idle connection (or creates one), runs the command
// on that connection's strand and returns the connection to the pool only if
// the exchange succeeded.  When a pooled connection turns out to have been
// closed by the server, the command is sent once more on a new connection.  Any number of coroutines may call command()
// concurrently; each gets its own connection.
//
// Typical usage:
//   RedisClient client{ioc, cfg.redis, logger};
//   auto result = co_await client.command({"GET", key});

class RedisClient {
public:
    // Idle connections kept around for reuse; extra ones are closed.
    static constexpr std::size_t kMaxIdleConnections = 16;

    RedisClient(boost::asio::io_context& ioc,
                RedisConfig config,
                std::shared_ptr<spdlog::logger> logger);

    RedisClient(const RedisClient&)            = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    [[nodiscard]] boost::asio::awaitable<RedisResult> command(std::vector<std::string> args);

    // Number of pooled idle connections (for tests).
    [[nodiscard]] std::size_t idle_connections() const;

private:
    [[nodiscard]] boost::asio::awaitable<RedisResult>
    run(std::shared_ptr<RedisConnection> conn, std::vector<std::string> args);

    [[nodiscard]] std::shared_ptr<RedisConnection> acquire();
    void release(std::shared_ptr<RedisConnection> conn);

    boost::asio::io_context&        ioc_;
    RedisConfig                     config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex                            mutex_;
    std::vector<std::shared_ptr<RedisConnection>> idle_;
};

} // namespace notes::network

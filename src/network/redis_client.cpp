#include "network/redis_client.hpp"
#include "network/resolver.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <string>
#include <utility>

namespace notes::network {

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

bool is_peer_close(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::broken_pipe;
}
} // anonymous namespace

// ── RedisConnection ──────────────────────────────────────────────────────────

RedisConnection::RedisConnection(boost::asio::io_context& ioc,
                                 const RedisConfig& config,
                                 std::shared_ptr<spdlog::logger> logger)
    : strand_(boost::asio::make_strand(ioc)),
      stream_(strand_),
      host_(config.host),
      port_(config.port),
      password_(config.password),
      db_(config.db),
      timeout_(config.timeout_ms),
      logger_(std::move(logger)) {}

boost::asio::awaitable<RedisResult>
RedisConnection::execute(std::vector<std::string> args) {
    closed_by_peer_ = false;
    if (!connected_) {
        auto connect_result = co_await connect();
        if (auto* err = std::get_if<ClientError>(&connect_result)) {
            co_return std::move(*err);
        }
    }
    co_return co_await exchange(args);
}

boost::asio::awaitable<std::variant<std::monostate, ClientError>>
RedisConnection::connect() {
    using tcp = boost::asio::ip::tcp;

    auto resolved = co_await resolve(host_, std::to_string(port_), timeout_);
    if (auto* err = std::get_if<ClientError>(&resolved)) {
        logger_->debug("Redis {}:{} {}", host_, port_, err->message);
        co_return std::move(*err);
    }

    stream_.expires_after(timeout_);
    auto [cec, ep] = co_await stream_.async_connect(
        std::get<tcp::resolver::results_type>(resolved), use_awaitable);
    if (cec) {
        logger_->debug("Redis connect to {}:{} failed: {}", host_, port_, cec.message());
        fail();
        co_return ClientError{"connect to " + host_ + ":" + std::to_string(port_) +
                              " failed: " + cec.message()};
    }

    // Disable Nagle: every command is a small request/reply round trip.
    boost::system::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);
    connected_ = true;

    if (!password_.empty()) {
        auto auth = co_await exchange({"AUTH", password_});
        if (auto* err = std::get_if<ClientError>(&auth)) {
            co_return std::move(*err);
        }
        if (std::get<RespReply>(auth).is_error()) {
            const std::string msg = std::get<RespReply>(auth).str;
            fail();
            co_return ClientError{"AUTH rejected: " + msg};
        }
    }

    if (db_ != 0) {
        auto select = co_await exchange({"SELECT", std::to_string(db_)});
        if (auto* err = std::get_if<ClientError>(&select)) {
            co_return std::move(*err);
        }
        if (std::get<RespReply>(select).is_error()) {
            const std::string msg = std::get<RespReply>(select).str;
            fail();
            co_return ClientError{"SELECT " + std::to_string(db_) + " rejected: " + msg};
        }
    }

    logger_->debug("Redis connected to {}:{}", host_, port_);
    co_return std::monostate{};
}

boost::asio::awaitable<RedisResult>
RedisConnection::exchange(const std::vector<std::string>& args) {
    const std::string wire = serialize_resp_command(args);

    // One deadline covers the write and the reply.
    stream_.expires_after(timeout_);

    auto [wec, _] = co_await boost::asio::async_write(
        stream_, boost::asio::buffer(wire), use_awaitable);
    if (wec) {
        closed_by_peer_ = is_peer_close(wec);
        logger_->warn("Redis {}:{} write error: {}", host_, port_, wec.message());
        fail();
        co_return ClientError{"write failed: " + wec.message()};
    }

    // Wait for the first reply byte separately so that a connection the
    // server dropped while idle is told apart from a slow or broken reply.
    if (read_buf_.empty()) {
        auto [rec, n] = co_await boost::asio::async_read(
            stream_, boost::asio::dynamic_buffer(read_buf_),
            boost::asio::transfer_at_least(1), use_awaitable);
        if (rec) {
            closed_by_peer_ = is_peer_close(rec);
            logger_->warn("Redis {}:{} read error: {}", host_, port_, rec.message());
            fail();
            co_return ClientError{"read failed: " + rec.message()};
        }
    }

    auto reply = co_await read_resp_reply(stream_, read_buf_);
    if (auto* err = std::get_if<ClientError>(&reply)) {
        logger_->warn("Redis {}:{} {}", host_, port_, err->message);
        fail();
        co_return reply;
    }

    // Idle pooled connections must not time out.
    stream_.expires_never();
    co_return reply;
}

void RedisConnection::fail() {
    stream_.close();
    connected_ = false;
    read_buf_.clear();
}

// ── RedisClient ──────────────────────────────────────────────────────────────

RedisClient::RedisClient(boost::asio::io_context& ioc,
                         RedisConfig config,
                         std::shared_ptr<spdlog::logger> logger)
    : ioc_(ioc),
      config_(std::move(config)),
      logger_(std::move(logger)) {}

boost::asio::awaitable<RedisResult>
RedisClient::command(std::vector<std::string> args) {
    auto conn = acquire();
    const bool pooled = conn->is_connected();

    auto result = co_await run(conn, args);

    // The server may close idle connections; retry once on a new connection.
    if (pooled && std::holds_alternative<ClientError>(result) && conn->closed_by_peer()) {
        logger_->debug("Redis {}:{} closed a pooled connection, reconnecting",
                       config_.host, config_.port);
        conn   = std::make_shared<RedisConnection>(ioc_, config_, logger_);
        result = co_await run(conn, std::move(args));
    }

    if (std::holds_alternative<RespReply>(result)) {
        release(std::move(conn));
    }
    co_return result;
}

boost::asio::awaitable<RedisResult>
RedisClient::run(std::shared_ptr<RedisConnection> conn, std::vector<std::string> args) {
    co_return co_await boost::asio::co_spawn(
        conn->strand(),
        [conn, args = std::move(args)]() mutable -> boost::asio::awaitable<RedisResult> {
            co_return co_await conn->execute(std::move(args));
        },
        boost::asio::use_awaitable);
}

std::size_t RedisClient::idle_connections() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

std::shared_ptr<RedisConnection> RedisClient::acquire() {
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }
    }
    return std::make_shared<RedisConnection>(ioc_, config_, logger_);
}

void RedisClient::release(std::shared_ptr<RedisConnection> conn) {
    std::lock_guard lock(mutex_);
    if (idle_.size() < kMaxIdleConnections && conn->is_connected()) {
        idle_.push_back(std::move(conn));
    }
}

} // namespace notes::network
